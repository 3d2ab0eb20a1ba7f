/**
 * @file journal_client.hpp
 * @brief Leveled logging façade writing to the systemd journal
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <atomic>
#include <cstdlib>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "journal_types.hpp"
#include "journal_stack.hpp"
#include "journal_caller.hpp"
#include "journal_assembler.hpp"
#include "journal_writers.hpp"
#include "journal_dispatcher.hpp"

namespace sjournal
{

/**
 * @brief Construction options for journal_client
 */
struct client_options
{
    std::string socket_path{DEFAULT_SOCKET_PATH}; ///< Journal socket to connect to
    size_t queue_capacity{DEFAULT_QUEUE_CAPACITY}; ///< Records in flight before producers block
    bool debug{false};                             ///< Initial state of the debug gate
    bool report_failures_on_shutdown{true};        ///< Print a failure summary to stderr at shutdown
    std::shared_ptr<stack_walker> walker;          ///< nullptr selects boost_stack_walker

    /**
     * @brief Defaults overridden by SJOURNAL_SOCKET and SJOURNAL_DEBUG
     */
    static client_options from_env()
    {
        client_options options;

        const char *socket = std::getenv("SJOURNAL_SOCKET");
        if (socket && *socket) { options.socket_path = socket; }

        if (auto debug = bool_from_string(std::getenv("SJOURNAL_DEBUG"))) { options.debug = *debug; }

        return options;
    }
};

/**
 * @brief Client for the journal's native protocol
 *
 * Every logging call resolves the caller, formats the message printf-style,
 * assembles one record and queues it; a background thread writes the records
 * to the journal socket. Calls block only while the delivery queue is full.
 * Records may be lost if the daemon goes away; call flush() before exiting to
 * make sure queued records have been written.
 *
 * @code
 * sjournal::journal_client journal;              // throws connection_error without a journal
 * journal.add_variable("SESSION_ID", session);   // attached to every later record
 * journal.info("listening on port %d", port);
 * journal.error("failed: %s", reason.c_str());
 * journal.flush();
 * @endcode
 */
class journal_client
{
  public:
    /// Connect to the journal at DEFAULT_SOCKET_PATH
    journal_client() : journal_client(client_options{}) {}

    /// Connect to options.socket_path
    explicit journal_client(const client_options &options)
    : journal_client(std::make_unique<unix_datagram_writer>(options.socket_path), options)
    {
    }

    /// Use a caller-provided transport
    explicit journal_client(std::unique_ptr<datagram_writer> writer, const client_options &options = {})
    : debug_(options.debug),
      resolver_(options.walker),
      dispatcher_(std::move(writer), options.queue_capacity, options.report_failures_on_shutdown)
    {
    }

    journal_client(const journal_client &)            = delete;
    journal_client &operator=(const journal_client &) = delete;

    /**
     * @brief Attach NAME=value to every record logged after this call
     */
    void add_variable(std::string_view name, std::string_view value) { assembler_.add_variable(name, value); }

    /// Log at debug priority (7); does nothing unless the debug gate is open
    template <typename... Args> void debug(const char *format, const Args &...args)
    {
        if (!debug_.load(std::memory_order_relaxed)) return;
        submit(priority::debug, format, args...);
    }

    template <typename... Args> void info(const char *format, const Args &...args)
    {
        submit(priority::info, format, args...);
    }

    template <typename... Args> void notice(const char *format, const Args &...args)
    {
        submit(priority::notice, format, args...);
    }

    template <typename... Args> void warning(const char *format, const Args &...args)
    {
        submit(priority::warning, format, args...);
    }

    template <typename... Args> void error(const char *format, const Args &...args)
    {
        submit(priority::err, format, args...);
    }

    template <typename... Args> void critical(const char *format, const Args &...args)
    {
        submit(priority::crit, format, args...);
    }

    /// Log at an explicit priority; debug obeys the debug gate
    template <typename... Args> void log(priority p, const char *format, const Args &...args)
    {
        if (p == priority::debug && !debug_.load(std::memory_order_relaxed)) return;
        submit(p, format, args...);
    }

    void set_debug(bool enabled) noexcept { debug_.store(enabled, std::memory_order_relaxed); }
    bool debug_enabled() const noexcept { return debug_.load(std::memory_order_relaxed); }

    /**
     * @brief Report callers of functions in @p prefix instead of the functions themselves
     *
     * For applications that wrap the client, e.g. add_logging_scope("myapp::logger::").
     */
    void add_logging_scope(std::string prefix) { resolver_.add_logging_scope(std::move(prefix)); }

    /// Block until every record queued so far has been written
    void flush() { dispatcher_.flush(); }

    /// Deliver what is queued and stop the writer thread; later calls are dropped
    void shutdown() { dispatcher_.shutdown(); }

    journal_dispatcher::stats stats() const { return dispatcher_.get_stats(); }

    size_t caller_cache_size() const { return resolver_.cache_size(); }

  private:
    template <typename... Args> void submit(priority p, const char *format, const Args &...args)
    {
        auto where   = resolver_.resolve(0);
        auto message = record_assembler::format_message(format, args...);

        // Refused only after shutdown; the drop shows up in stats()
        dispatcher_.dispatch(assembler_.assemble(p, *where, message));
    }

    std::atomic<bool> debug_;
    caller_resolver resolver_;
    record_assembler assembler_;

    // Last member: destroyed first, so the worker stops before the rest goes away
    journal_dispatcher dispatcher_;
};

} // namespace sjournal
