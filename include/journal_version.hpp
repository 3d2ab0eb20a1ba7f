/**
 * @file journal_version.hpp
 * @brief Version information for the sjournal client library
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

namespace sjournal
{

#ifndef SJOURNAL_VERSION_STRING
    #define SJOURNAL_VERSION_STRING "dev"
#endif

inline constexpr const char *VERSION = SJOURNAL_VERSION_STRING;

} // namespace sjournal
