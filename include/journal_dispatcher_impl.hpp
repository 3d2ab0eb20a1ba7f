/**
 * @file journal_dispatcher_impl.hpp
 * @brief Implementation of the delivery dispatcher and its worker thread
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdio>
#include <exception>

#include "fmt_config.hpp" // IWYU pragma: keep
#include "journal_dispatcher.hpp"

namespace sjournal
{

inline journal_dispatcher::journal_dispatcher(std::unique_ptr<datagram_writer> writer,
                                              size_t capacity,
                                              bool report_failures_on_exit)
: writer_(writer ? std::move(writer) : std::make_unique<discard_writer>()),
  capacity_(capacity > 0 ? capacity : 1),
  report_failures_on_exit_(report_failures_on_exit),
  queue_(capacity_ + 2), // Room for the records plus a flush and a shutdown marker
  slots_(static_cast<moodycamel::LightweightSemaphore::ssize_t>(capacity_)),
  producer_token_(queue_),
  worker_thread_(&journal_dispatcher::worker_thread_func, this),
  worker_id_(worker_thread_.get_id())
{
}

inline journal_dispatcher::~journal_dispatcher() { shutdown(); }

inline bool journal_dispatcher::dispatch(std::string record)
{
    std::lock_guard<std::mutex> lock(enqueue_mutex_);
    if (shutdown_)
    {
        records_dropped_++;
        return false;
    }

    // Backpressure: wait for a free slot. The worker runs until the shutdown
    // marker, which cannot be queued while we hold the lock.
    if (!slots_.wait())
    {
        records_dropped_++;
        return false;
    }

    update_atomic_max(max_queue_depth_, in_flight_.fetch_add(1, std::memory_order_relaxed) + 1);

    queued_record item;
    item.type  = queued_record::kind::record;
    item.bytes = std::move(record);
    queue_.enqueue(producer_token_, std::move(item));
    records_enqueued_++;
    return true;
}

inline void journal_dispatcher::flush()
{
    queued_record marker;
    marker.type = queued_record::kind::flush;
    auto done   = marker.done.get_future();

    {
        std::lock_guard<std::mutex> lock(enqueue_mutex_);
        if (shutdown_) return;
        queue_.enqueue(producer_token_, std::move(marker));
    }
    done.wait();
}

inline void journal_dispatcher::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(enqueue_mutex_);
        if (!shutdown_)
        {
            shutdown_ = true;

            queued_record marker;
            marker.type = queued_record::kind::shutdown;
            queue_.enqueue(producer_token_, std::move(marker));
        }
    }

    // A writer calling shutdown() from the worker cannot join itself
    if (std::this_thread::get_id() == worker_id_) return;

    // Concurrent callers wait here until the first one has joined
    std::lock_guard<std::mutex> lock(join_mutex_);
    if (worker_thread_.joinable()) { worker_thread_.join(); }
}

inline journal_dispatcher::stats journal_dispatcher::get_stats() const
{
    stats s;
    s.records_enqueued = records_enqueued_.load(std::memory_order_relaxed);
    s.records_written  = records_written_.load(std::memory_order_relaxed);
    s.write_failures   = write_failures_.load(std::memory_order_relaxed);
    s.records_dropped  = records_dropped_.load(std::memory_order_relaxed);
    s.flushes          = flushes_.load(std::memory_order_relaxed);
    s.max_queue_depth  = max_queue_depth_.load(std::memory_order_relaxed);
    s.current_depth    = in_flight_.load(std::memory_order_relaxed);
    s.capacity         = capacity_;
    return s;
}

inline void journal_dispatcher::worker_thread_func()
{
    moodycamel::ConsumerToken consumer_token(queue_);

    for (;;)
    {
        queued_record item;
        queue_.wait_dequeue(consumer_token, item);

        // Nothing is queued after the shutdown marker
        if (item.type == queued_record::kind::shutdown) { break; }
        process(item);
    }

    if (report_failures_on_exit_) { report_failures(); }
}

inline void journal_dispatcher::process(queued_record &item)
{
    switch (item.type)
    {
    case queued_record::kind::record:
        write_record(item.bytes);
        in_flight_.fetch_sub(1, std::memory_order_relaxed);
        slots_.signal();
        break;
    case queued_record::kind::flush:
        flushes_++;
        item.done.set_value();
        break;
    case queued_record::kind::shutdown: break;
    }
}

inline void journal_dispatcher::write_record(const std::string &bytes)
{
    bool ok = false;
    try
    {
        ok = writer_->write(bytes.data(), bytes.size());
    }
    catch (const std::exception &)
    {
        // A throwing writer counts as a failed write; the worker keeps running
        ok = false;
    }

    if (ok) { records_written_++; }
    else { write_failures_++; }
}

inline void journal_dispatcher::report_failures() const
{
    uint64_t failures = write_failures_.load(std::memory_order_relaxed);
    if (failures == 0) return;

    uint64_t total = failures + records_written_.load(std::memory_order_relaxed);
    fmt::print(stderr, "[sjournal] {} of {} journal records could not be delivered\n", failures, total);
}

inline void journal_dispatcher::update_atomic_max(std::atomic<uint64_t> &atomic_val, uint64_t new_val)
{
    uint64_t current = atomic_val.load(std::memory_order_relaxed);
    while (new_val > current && !atomic_val.compare_exchange_weak(current, new_val, std::memory_order_relaxed))
    {
    }
}

} // namespace sjournal
