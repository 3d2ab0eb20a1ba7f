/**
 * @file journal_dispatcher.hpp
 * @brief Asynchronous delivery of encoded records to a datagram writer
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Producers hand finished records to dispatch(); a single worker thread owns
 * the writer and sends them one at a time. The queue is bounded: capacity
 * counts records waiting in the queue plus the record currently being
 * written, and a producer that finds it full blocks until the worker finishes
 * a write. Nothing is dropped for lack of space.
 *
 * Every item enters the queue through one producer token while holding
 * enqueue_mutex_, so the worker sees items in the order the enqueues
 * completed, across all producer threads.
 *
 * Write failures are counted and otherwise ignored; there is no retry and no
 * report back to the producer.
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "moodycamel/blockingconcurrentqueue.h"
#include "moodycamel/lightweightsemaphore.h"

#include "journal_types.hpp"
#include "journal_writers.hpp"

namespace sjournal
{

/**
 * @brief Item travelling through the delivery queue
 */
struct queued_record
{
    enum class kind : uint8_t
    {
        record,   ///< Encoded record to write
        flush,    ///< Completes @ref done once everything queued before it was handled
        shutdown, ///< Last item ever queued; stops the worker
    };

    kind type{kind::record};
    std::string bytes;
    std::promise<void> done;
};

/**
 * @brief Bounded delivery queue with a single writer thread
 */
class journal_dispatcher
{
  public:
    /**
     * @brief Delivery statistics
     */
    struct stats
    {
        uint64_t records_enqueued; ///< Records accepted by dispatch()
        uint64_t records_written;  ///< Records the writer accepted
        uint64_t write_failures;   ///< Records the writer rejected
        uint64_t records_dropped;  ///< Records refused because the dispatcher was shut down
        uint64_t flushes;          ///< Completed flush() calls
        uint64_t max_queue_depth;  ///< Highest number of records in flight observed
        uint64_t current_depth;    ///< Records queued or being written right now
        size_t capacity;           ///< Configured capacity
    };

    journal_dispatcher(std::unique_ptr<datagram_writer> writer,
                       size_t capacity               = DEFAULT_QUEUE_CAPACITY,
                       bool report_failures_on_exit = true);

    journal_dispatcher(const journal_dispatcher &)            = delete;
    journal_dispatcher &operator=(const journal_dispatcher &) = delete;

    ~journal_dispatcher();

    /**
     * @brief Queue a record for delivery, blocking while the queue is full
     *
     * A producer waiting for a slot holds the enqueue lock, so later
     * producers queue up behind it in arrival order.
     *
     * @return false if the dispatcher has been shut down and the record was dropped
     */
    bool dispatch(std::string record);

    /**
     * @brief Wait until every record dispatched before the call was handled
     *
     * Returns immediately after shutdown. Must not be called from the writer.
     */
    void flush();

    /**
     * @brief Stop accepting records, deliver what is queued and stop the worker
     *
     * Safe to call more than once and from several threads at once; every
     * caller other than the worker returns after the worker has exited.
     */
    void shutdown();

    stats get_stats() const;

    size_t capacity() const noexcept { return capacity_; }

  private:
    void worker_thread_func();
    void process(queued_record &item);
    void write_record(const std::string &bytes);
    void report_failures() const;

    static void update_atomic_max(std::atomic<uint64_t> &atomic_val, uint64_t new_val);

    std::unique_ptr<datagram_writer> writer_;
    const size_t capacity_;
    const bool report_failures_on_exit_;

    moodycamel::BlockingConcurrentQueue<queued_record> queue_;
    moodycamel::LightweightSemaphore slots_;

    // Guards producer_token_ and shutdown_; held across the slot wait
    std::mutex enqueue_mutex_;
    moodycamel::ProducerToken producer_token_;
    bool shutdown_{false};

    std::mutex join_mutex_;
    std::atomic<uint64_t> in_flight_{0};

    std::atomic<uint64_t> records_enqueued_{0};
    std::atomic<uint64_t> records_written_{0};
    std::atomic<uint64_t> write_failures_{0};
    std::atomic<uint64_t> records_dropped_{0};
    std::atomic<uint64_t> flushes_{0};
    std::atomic<uint64_t> max_queue_depth_{0};

    // Declared last so the other members exist before the worker starts
    std::thread worker_thread_;
    std::thread::id worker_id_;
};

} // namespace sjournal
