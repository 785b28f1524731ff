/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file scheduler.hpp
 * @brief Timer-driven task loop backing the periodic and reconnect sync triggers.
 *
 * @details
 * The offline core is single-writer: one logical client drives the document
 * store. Background work (the replay timer, the debounced reconnect drain) is
 * therefore executed by a small, by default single-threaded, event loop rather
 * than an open-ended pool. Tasks may run immediately, after a delay, or
 * periodically, and any scheduled task can be cancelled by id.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace aula::infra {

/**
 * @class Scheduler
 * @brief Worker loop executing immediate, delayed and periodic tasks.
 *
 * @details
 * **Concurrency Model:**
 * - **Producers:** any thread may `enqueue()`, `schedule_after()` or `schedule_every()`.
 * - **Consumers:** worker threads sleep on a condition variable until the
 *   earliest deadline passes or a shutdown is requested.
 *
 * Exceptions escaping a task are logged and do not terminate the worker.
 */
class Scheduler {
  public:
    using TaskId = std::uint64_t;
    using Duration = std::chrono::milliseconds;

    /**
     * @brief Spawns the worker threads.
     *
     * @param threads Worker count. One worker gives event-loop ordering: tasks
     * never overlap.
     */
    explicit Scheduler(size_t threads = 1);

    /**
     * @brief Stops the loop and joins every worker.
     *
     * Tasks whose deadline has already passed are still executed; future-dated
     * and periodic tasks are discarded.
     */
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /// @brief Runs `task` as soon as a worker is free.
    TaskId enqueue(std::function<void()> task);

    /// @brief Runs `task` once, `delay` from now.
    TaskId schedule_after(Duration delay, std::function<void()> task);

    /**
     * @brief Runs `task` every `interval`, first after one full interval.
     */
    TaskId schedule_every(Duration interval, std::function<void()> task);

    /**
     * @brief Cancels a pending task. A run already in progress completes.
     *
     * @return true if the task was still scheduled.
     */
    bool cancel(TaskId id);

    /// @brief Number of tasks still scheduled (including periodic ones).
    size_t pending() const;

  private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        std::function<void()> task;
        Duration interval{0}; ///< Zero for one-shot tasks.
    };

    TaskId schedule(Clock::time_point due, Duration interval, std::function<void()> task);
    void worker_loop();

    std::vector<std::thread> workers_;

    /// @brief Deadline-ordered index into `entries_`. Cancelled ids are skipped lazily.
    std::multimap<Clock::time_point, TaskId> timeline_;

    std::unordered_map<TaskId, Entry> entries_;

    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_;
    TaskId next_id_ = 1;
};

} // namespace aula::infra
