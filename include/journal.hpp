/**
 * @file journal.hpp
 * @brief Asynchronous client for the systemd journal native protocol
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * This library provides:
 * - Binary-safe encoding of journal fields (values may contain newlines or any byte)
 * - Asynchronous delivery over the journal's AF_UNIX datagram socket
 * - Bounded delivery queue with backpressure instead of silent loss on overload
 * - CODE_FILE / CODE_LINE / CODE_FUNC resolved from the call stack and cached per call site
 * - Process-wide extra fields attached to every record
 * - Oversized records passed to the daemon through a sealed memfd
 *
 * Basic Usage:
 * @code
 * #include "journal.hpp"
 *
 * sjournal::journal_client journal;           // connects to /run/systemd/journal/socket
 * journal.add_variable("SESSION", "42");
 *
 * journal.info("starting");
 * journal.error("failed: %s", "disk full");
 * journal.debug("only written after set_debug(true)");
 *
 * journal.flush();                            // wait until the records above are written
 * @endcode
 *
 * Record layout (one datagram per record):
 * @code
 * PRIORITY   "6"
 * CODE_FILE  "/src/server.cpp"
 * CODE_LINE  "42"
 * CODE_FUNC  "server::start()"
 * SESSION    "42"                             // extra variables, in registration order
 * MESSAGE    "starting"
 * @endcode
 *
 * Each field is NAME '\n' <uint64 little-endian length> <value> '\n'.
 *
 * Configuration:
 * @code
 * auto options = sjournal::client_options::from_env();   // SJOURNAL_SOCKET, SJOURNAL_DEBUG
 * options.queue_capacity = 1000;
 * sjournal::journal_client journal(options);
 * @endcode
 *
 * Caller Resolution:
 * - The stack is captured on every call, but each program counter is symbolized
 *   only once; the encoded CODE_* fields are cached for the client's lifetime
 * - Frames of the client itself are skipped; wrap the client in your own helpers
 *   and register them with add_logging_scope() so the helper's caller is reported
 * - Without debug information CODE_FILE is empty and CODE_LINE is 0
 *
 * Thread Safety:
 * - All logging operations and add_variable() are thread-safe
 * - Records are written in the order their logging calls queued them, across all threads
 * - flush() covers every record queued before it, from any thread
 * - shutdown() may race with logging threads; records that lose the race are
 *   dropped and counted
 * - A single writer thread owns the socket
 *
 * Error Handling:
 * - Constructing a client that connects to a socket throws connection_error
 *   when the socket cannot be reached; this is the only reported error
 * - Failed writes are counted in stats() and otherwise ignored
 * - A template that does not match its arguments produces the raw template and
 *   the formatter's error as the message
 */
#pragma once

#include "fmt_config.hpp"         // IWYU pragma: keep
#include "journal_version.hpp"    // IWYU pragma: keep
#include "journal_types.hpp"      // IWYU pragma: keep
#include "journal_error.hpp"      // IWYU pragma: keep
#include "journal_field.hpp"      // IWYU pragma: keep
#include "journal_stack.hpp"      // IWYU pragma: keep
#include "journal_caller.hpp"     // IWYU pragma: keep
#include "journal_assembler.hpp"  // IWYU pragma: keep
#include "journal_writers.hpp"    // IWYU pragma: keep
#include "journal_dispatcher.hpp" // IWYU pragma: keep
#include "journal_client.hpp"     // IWYU pragma: keep

#include "journal_dispatcher_impl.hpp" // IWYU pragma: keep
