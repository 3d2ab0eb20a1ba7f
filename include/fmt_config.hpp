/**
 * @file fmt_config.hpp
 * @brief fmt configuration for header-only use
 *
 * sjournal is header-only and uses fmt the same way, so no separate fmt
 * library has to be built or linked. printf.h provides fmt::sprintf, which
 * formats the printf-style templates passed to the journal client.
 */
#pragma once

#ifndef FMT_HEADER_ONLY
#define FMT_HEADER_ONLY
#endif

#include <fmt/format.h>
#include <fmt/printf.h>
