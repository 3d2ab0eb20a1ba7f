/**
 * @file journal_error.hpp
 * @brief Exceptions thrown by the journal client
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cerrno>
#include <string>
#include <system_error>

namespace sjournal
{

/**
 * @brief The journal socket could not be opened or connected
 *
 * This is the only error the client reports. It is thrown from construction;
 * once a client exists, delivery problems are absorbed by the writer thread.
 */
class connection_error : public std::system_error
{
  public:
    connection_error(int err, const std::string &path)
    : std::system_error(err, std::generic_category(), "Failed to connect to journal socket " + path),
      path_(path)
    {
    }

    const std::string &path() const noexcept { return path_; }

  private:
    std::string path_;
};

} // namespace sjournal
