/**
 * @file journal_assembler.hpp
 * @brief Builds complete encoded records from priority, location, extra variables and message
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <array>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>

#include "fmt_config.hpp" // IWYU pragma: keep
#include "journal_types.hpp"
#include "journal_field.hpp"
#include "journal_caller.hpp"

namespace sjournal
{

/**
 * @brief Assembles records in the fixed order PRIORITY, CODE_*, extra variables, MESSAGE
 *
 * The PRIORITY field of every severity is encoded once at construction. The
 * extra variables are an append-only buffer of encoded fields; add_variable()
 * takes the exclusive lock and assemble() copies the buffer under the shared
 * lock, so variables may be added while other threads are logging.
 */
class record_assembler
{
  public:
    record_assembler()
    {
        for (size_t i = 0; i < PRIORITY_COUNT; ++i)
        {
            char digit           = static_cast<char>('0' + i);
            priority_fields_[i] = encode_field(FIELD_PRIORITY, std::string_view(&digit, 1));
        }
    }

    record_assembler(const record_assembler &)            = delete;
    record_assembler &operator=(const record_assembler &) = delete;

    /**
     * @brief Add a field to every record assembled from now on
     *
     * Records already assembled are not affected. Adding the same name twice
     * adds two fields; the journal keeps both values.
     */
    void add_variable(std::string_view name, std::string_view value)
    {
        std::unique_lock lock(extra_mutex_);
        append_field(extra_vars_, name, value);
    }

    /// Snapshot of the encoded extra variables
    std::string extra_variables() const
    {
        std::shared_lock lock(extra_mutex_);
        return extra_vars_;
    }

    const std::string &priority_field(priority p) const { return priority_fields_[static_cast<size_t>(p)]; }

    /**
     * @brief Build one record ready for transmission
     */
    std::string assemble(priority p, const caller_location &where, std::string_view message) const
    {
        const std::string &pri = priority_field(p);

        std::string record;
        {
            std::shared_lock lock(extra_mutex_);
            record.reserve(pri.size() + where.encoded.size() + extra_vars_.size() + message.size() +
                           MESSAGE_FIELD_SLACK);
            record.append(pri);
            record.append(where.encoded);
            record.append(extra_vars_);
        }
        append_field(record, FIELD_MESSAGE, message);
        return record;
    }

    /**
     * @brief Format a printf-style template
     *
     * A template that does not match its arguments yields the raw template
     * followed by the formatter's complaint instead of throwing; logging never
     * fails the caller.
     */
    template <typename... Args> static std::string format_message(const char *format, const Args &...args)
    {
        if (!format) return {};

        try
        {
            return fmt::sprintf(format, args...);
        }
        catch (const fmt::format_error &e)
        {
            return fmt::format("{} (format error: {})", format, e.what());
        }
    }

  private:
    std::array<std::string, PRIORITY_COUNT> priority_fields_;

    mutable std::shared_mutex extra_mutex_;
    std::string extra_vars_;
};

} // namespace sjournal
