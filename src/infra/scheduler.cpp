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
 * @file scheduler.cpp
 * @brief Implementation of the timer-driven task loop.
 */

#include "aula/infra/scheduler.hpp"

#include "aula/infra/logger.hpp"

#include <exception>
#include <string>

namespace aula::infra {

Scheduler::Scheduler(size_t threads) : stop_(false)
{
    if (threads == 0) {
        threads = 1;
    }
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

Scheduler::~Scheduler()
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }

    condition_.notify_all();

    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

Scheduler::TaskId Scheduler::enqueue(std::function<void()> task)
{
    return schedule(Clock::now(), Duration(0), std::move(task));
}

Scheduler::TaskId Scheduler::schedule_after(Duration delay, std::function<void()> task)
{
    return schedule(Clock::now() + delay, Duration(0), std::move(task));
}

Scheduler::TaskId Scheduler::schedule_every(Duration interval, std::function<void()> task)
{
    if (interval <= Duration(0)) {
        interval = Duration(1);
    }
    return schedule(Clock::now() + interval, interval, std::move(task));
}

Scheduler::TaskId Scheduler::schedule(Clock::time_point due, Duration interval,
                                      std::function<void()> task)
{
    TaskId id = 0;
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        id = next_id_++;
        entries_.emplace(id, Entry{std::move(task), interval});
        timeline_.emplace(due, id);
    }
    // A new earliest deadline must wake a sleeper to shorten its wait.
    condition_.notify_one();
    return id;
}

bool Scheduler::cancel(TaskId id)
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return entries_.erase(id) > 0;
}

size_t Scheduler::pending() const
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return entries_.size();
}

/**
 * @brief Worker event loop.
 *
 * Sleeps until the earliest deadline, pops it, re-arms periodic tasks before
 * releasing the lock, then runs the task outside the critical section.
 */
void Scheduler::worker_loop()
{
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);

            while (true) {
                // Drop cancelled ids sitting at the head of the timeline.
                while (!timeline_.empty() && !entries_.count(timeline_.begin()->second)) {
                    timeline_.erase(timeline_.begin());
                }

                if (timeline_.empty()) {
                    if (stop_) {
                        return;
                    }
                    condition_.wait(lock);
                    continue;
                }

                auto head = timeline_.begin();
                if (head->first <= Clock::now()) {
                    break;
                }
                if (stop_) {
                    return;
                }
                condition_.wait_until(lock, head->first);
            }

            auto head = timeline_.begin();
            TaskId id = head->second;
            timeline_.erase(head);

            auto it = entries_.find(id);
            if (it->second.interval > Duration(0)) {
                task = it->second.task;
                if (!stop_) {
                    timeline_.emplace(Clock::now() + it->second.interval, id);
                } else {
                    entries_.erase(it);
                }
            } else {
                task = std::move(it->second.task);
                entries_.erase(it);
            }
        }

        if (task) {
            try {
                task();
            } catch (const std::exception& e) {
                Logger::log(LogLevel::ERROR,
                            std::string("Scheduler: Task raised an exception: ") + e.what());
            }
        }
    }
}

} // namespace aula::infra
