/**
 * @file journal_caller.hpp
 * @brief Caller location resolution and caching
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "robin_hood.h"
#include "fmt_config.hpp" // IWYU pragma: keep
#include "journal_types.hpp"
#include "journal_field.hpp"
#include "journal_stack.hpp"

namespace sjournal
{

/**
 * @brief Resolved location of one call site
 *
 * Entries are immutable once published; they are shared between the cache
 * and every record assembled for the same program counter.
 */
struct caller_location
{
    std::string file;
    uint32_t line{0};
    std::string function;
    std::uintptr_t identity{0}; ///< Program counter of the frame, stable for the process lifetime
    bool library{false};        ///< Frame belongs to the logging layer and is skipped
    std::string encoded;        ///< CODE_FILE, CODE_LINE and CODE_FUNC fields, ready to copy into a record
};

using caller_location_ptr = std::shared_ptr<const caller_location>;

/**
 * @brief Deny-list deciding which frames belong to the logging layer
 *
 * A frame is a logging frame when the qualified part of its function name
 * (everything before the argument list) contains one of the registered
 * scope prefixes. Applications that wrap the client in their own helpers
 * register the helpers' scope so that the helper's caller is reported instead.
 */
class frame_filter
{
  public:
    frame_filter()
    : scopes_{
          "sjournal::journal_client::",
          "sjournal::record_assembler::",
          "sjournal::caller_resolver::",
          "sjournal::stack_walker",
          "sjournal::boost_stack_walker::",
          "boost::stacktrace::",
      }
    {
    }

    void add_scope(std::string prefix)
    {
        if (prefix.empty()) return;

        std::unique_lock lock(mutex_);
        for (const auto &s : scopes_)
        {
            if (s == prefix) return;
        }
        scopes_.push_back(std::move(prefix));
    }

    bool is_library_frame(std::string_view function) const
    {
        if (function.empty()) return false;

        // Only look at the qualified name, not at parameter types
        auto paren = function.find('(');
        if (paren != std::string_view::npos) { function = function.substr(0, paren); }

        std::shared_lock lock(mutex_);
        for (const auto &s : scopes_)
        {
            if (function.find(s) != std::string_view::npos) return true;
        }
        return false;
    }

    std::vector<std::string> scopes() const
    {
        std::shared_lock lock(mutex_);
        return scopes_;
    }

  private:
    mutable std::shared_mutex mutex_;
    std::vector<std::string> scopes_;
};

/**
 * @brief Finds and caches the first non-logging frame of the current stack
 *
 * The program counters are captured on every call. Each distinct program
 * counter is symbolized once and the encoded CODE_* fields are kept in a
 * cache for the lifetime of the resolver. The cache is read under a shared
 * lock and written under an exclusive lock only for the insert; two threads
 * missing on the same program counter both symbolize it and the last insert
 * wins, which is harmless because both produce identical entries.
 */
class caller_resolver
{
  public:
    explicit caller_resolver(std::shared_ptr<stack_walker> walker)
    : walker_(walker ? std::move(walker) : std::make_shared<boost_stack_walker>()),
      unknown_(make_location(0, call_frame{"unknown", 0, "unknown"}, false))
    {
    }

    caller_resolver(const caller_resolver &)            = delete;
    caller_resolver &operator=(const caller_resolver &) = delete;

    /**
     * @brief Resolve the caller of the logging operation
     * @param skip_frames Frames above resolve() to omit before filtering starts
     * @return Location of the first non-logging frame. When every collected
     *         frame is a logging frame the last one reached is returned, and
     *         when nothing could be collected an "unknown" location is returned.
     */
    caller_location_ptr resolve(size_t skip_frames)
    {
        std::array<std::uintptr_t, MAX_CALLER_DEPTH> pcs;
        size_t depth = walker_->collect(skip_frames + 1, pcs.data(), pcs.size());
        if (depth == 0) return unknown_;

        caller_location_ptr location;
        for (size_t i = 0; i < depth; ++i)
        {
            location = lookup(pcs[i]);
            if (!location->library) break;
        }
        return location;
    }

    /**
     * @brief Treat frames whose function is in @p prefix as logging frames
     *
     * Clears the cache, since cached entries carry the old classification.
     */
    void add_logging_scope(std::string prefix)
    {
        filter_.add_scope(std::move(prefix));

        std::unique_lock lock(cache_mutex_);
        cache_.clear();
    }

    size_t cache_size() const
    {
        std::shared_lock lock(cache_mutex_);
        return cache_.size();
    }

    const frame_filter &filter() const noexcept { return filter_; }

  private:
    caller_location_ptr lookup(std::uintptr_t pc)
    {
        {
            std::shared_lock lock(cache_mutex_);
            auto it = cache_.find(pc);
            if (it != cache_.end()) { return it->second; }
        }

        // Symbolize outside the lock; this is the slow path
        call_frame frame = walker_->symbolize(pc);
        bool library     = filter_.is_library_frame(frame.function);
        auto location    = make_location(pc, std::move(frame), library);

        std::unique_lock lock(cache_mutex_);
        cache_[pc] = location;
        return location;
    }

    static caller_location_ptr make_location(std::uintptr_t pc, call_frame frame, bool library)
    {
        auto location      = std::make_shared<caller_location>();
        location->file     = std::move(frame.file);
        location->line     = frame.line;
        location->function = std::move(frame.function);
        location->identity = pc;
        location->library  = library;

        auto line = fmt::format_int(location->line);
        location->encoded.reserve(encoded_field_size(FIELD_CODE_FILE, location->file) +
                                  encoded_field_size(FIELD_CODE_LINE, std::string_view(line.data(), line.size())) +
                                  encoded_field_size(FIELD_CODE_FUNC, location->function));
        append_field(location->encoded, FIELD_CODE_FILE, location->file);
        append_field(location->encoded, FIELD_CODE_LINE, std::string_view(line.data(), line.size()));
        append_field(location->encoded, FIELD_CODE_FUNC, location->function);
        return location;
    }

    std::shared_ptr<stack_walker> walker_;
    frame_filter filter_;
    caller_location_ptr unknown_;

    robin_hood::unordered_map<std::uintptr_t, caller_location_ptr> cache_;
    mutable std::shared_mutex cache_mutex_;
};

} // namespace sjournal
