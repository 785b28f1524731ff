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
 * @file replay_engine.cpp
 * @brief Implementation of the sync replay loop.
 */

#include "aula/sync/replay_engine.hpp"

#include "aula/infra/clock.hpp"
#include "aula/infra/logger.hpp"
#include "aula/storage/errors.hpp"

#include <thread>
#include <utility>

namespace aula::sync {

using infra::Json;
using infra::Logger;
using infra::LogLevel;

namespace {

/// @brief Runs the release step when a drain leaves scope.
class InFlightGuard {
  public:
    explicit InFlightGuard(std::function<void()> release) : release_(std::move(release)) {}
    ~InFlightGuard() { release_(); }

  private:
    std::function<void()> release_;
};

bool accepted(const ApiResponse& response, const SyncAction& action)
{
    if (!response.success) {
        Logger::log(LogLevel::WARN, "Sync: Server rejected " + action.type + " " + action.id +
                                        (response.error.empty() ? "" : ": " + response.error));
    }
    return response.success;
}

} // namespace

ReplayEngine::ReplayEngine(SyncQueue& queue, storage::FlatStore& flat, RemoteApi& api,
                           offline::ConnectivityMonitor& connectivity, infra::Scheduler& scheduler,
                           CommitPolicy policy)
    : queue_(queue), flat_(flat), api_(api), connectivity_(connectivity), scheduler_(scheduler),
      policy_(policy)
{
    install_default_handlers();
}

ReplayEngine::~ReplayEngine()
{
    stop();
}

void ReplayEngine::install_default_handlers()
{
    register_handler(action::kEnroll, [this](const SyncAction& a) {
        Json::Ptr data = a.payload();
        return accepted(api_.enroll(Json::get_string(data.get(), "courseId")), a);
    });

    register_handler(action::kQuizSubmission, [this](const SyncAction& a) {
        Json::Ptr data = a.payload();
        return accepted(api_.submit_quiz(Json::get_string(data.get(), "courseId"),
                                         Json::get_string(data.get(), "quizId"),
                                         Json::child(data.get(), "answers"),
                                         Json::get_number(data.get(), "score"),
                                         Json::get_int(data.get(), "timeSpent")),
                        a);
    });

    register_handler(action::kVideoProgress, [this](const SyncAction& a) {
        Json::Ptr data = a.payload();
        double progress = Json::get_number(data.get(), "percentage",
                                           Json::get_number(data.get(), "progress"));
        return accepted(api_.update_progress(Json::get_string(data.get(), "courseId"),
                                             Json::get_string(data.get(), "lessonId"), progress,
                                             Json::get_string(data.get(), "lastAccessed"),
                                             Json::child(data.get(), "completedLessons")),
                        a);
    });

    register_handler(action::kProfileUpdate, [this](const SyncAction& a) {
        Json::Ptr data = a.payload();
        return accepted(api_.update_profile(data.get()), a);
    });
}

void ReplayEngine::register_handler(const std::string& type, Handler handler)
{
    std::lock_guard lock(handlers_mutex_);
    handlers_[type] = std::move(handler);
}

ReplayEngine::ListenerId ReplayEngine::add_listener(Listener listener)
{
    std::lock_guard lock(listeners_mutex_);
    ListenerId id = next_listener_id_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

bool ReplayEngine::remove_listener(ListenerId id)
{
    std::lock_guard lock(listeners_mutex_);
    return listeners_.erase(id) > 0;
}

SyncResult ReplayEngine::drain()
{
    bool expected = false;
    if (!connectivity_.is_online() || !syncing_.compare_exchange_strong(expected, true)) {
        SyncResult refused;
        refused.success = false;
        refused.errors.push_back("Sync already in progress or offline");
        return refused;
    }
    {
        std::lock_guard lock(drain_mutex_);
        drain_thread_ = std::this_thread::get_id();
    }
    InFlightGuard guard([this]() { end_drain(); });

    SyncResult result;
    std::vector<SyncAction> batch = queue_.pending();
    if (batch.empty()) {
        Logger::log(LogLevel::DEBUG, "Sync: No items to sync.");
        return result;
    }

    Logger::log(LogLevel::INFO, "Sync: Starting sync of " + std::to_string(batch.size()) + " items.");

    std::vector<std::string> applied;
    for (const auto& item : batch) {
        Handler handler;
        {
            std::lock_guard lock(handlers_mutex_);
            auto it = handlers_.find(item.type);
            if (it != handlers_.end()) {
                handler = it->second;
            }
        }

        if (!handler) {
            ++result.failed;
            result.errors.push_back("Unknown sync action type: " + item.type);
            Logger::log(LogLevel::WARN, "Sync: Unknown action type " + item.type);
            continue;
        }

        try {
            if (handler(item)) {
                ++result.synced;
                applied.push_back(item.id);
                Logger::log(LogLevel::DEBUG, "Sync: Synced " + item.type + " " + item.id);
            } else {
                ++result.failed;
                result.errors.push_back("Failed to sync " + item.type + ": " + item.id);
            }
        } catch (const NetworkError& e) {
            ++result.failed;
            result.errors.push_back("Error syncing " + item.type + ": " + e.what());
            Logger::log(LogLevel::WARN, std::string("Sync: Network failure: ") + e.what());
        } catch (const std::exception& e) {
            ++result.failed;
            result.errors.push_back("Error syncing " + item.type + ": " + e.what());
            Logger::log(LogLevel::ERROR,
                        "Sync: Handler for " + item.type + " raised: " + e.what());
        }
    }

    commit(applied, result);

    Logger::log(LogLevel::INFO, "Sync: Completed: " + std::to_string(result.synced) +
                                    " synced, " + std::to_string(result.failed) + " failed.");
    notify(result);
    return result;
}

void ReplayEngine::commit(const std::vector<std::string>& applied, SyncResult& result)
{
    if (applied.empty()) {
        return;
    }

    try {
        if (policy_ == CommitPolicy::CLEAR_ON_ANY_SUCCESS) {
            queue_.clear();
        } else {
            queue_.remove(applied);
        }
    } catch (const storage::StoreError& e) {
        result.success = false;
        result.errors.push_back(std::string("Failed to update sync queue: ") + e.what());
        Logger::log(LogLevel::ERROR, std::string("Sync: Queue commit failed: ") + e.what());
        return;
    }

    try {
        flat_.set_item(kLastSyncKey, infra::Clock::now_iso8601());
    } catch (const storage::StoreError& e) {
        Logger::log(LogLevel::WARN, std::string("Sync: Could not record last sync time: ") +
                                        e.what());
    }
}

void ReplayEngine::notify(const SyncResult& result)
{
    std::vector<Listener> snapshot;
    {
        std::lock_guard lock(listeners_mutex_);
        for (const auto& [id, listener] : listeners_) {
            snapshot.push_back(listener);
        }
    }
    for (const auto& listener : snapshot) {
        listener(result);
    }
}

void ReplayEngine::check_and_sync()
{
    if (!connectivity_.is_online() || syncing_.load()) {
        return;
    }
    if (queue_.size() == 0) {
        return;
    }
    drain();
}

void ReplayEngine::on_connectivity(bool online)
{
    if (!online) {
        Logger::log(LogLevel::INFO, "Sync: Device went offline, pausing sync.");
        return;
    }

    Logger::log(LogLevel::INFO, "Sync: Device came online, checking for sync.");
    std::lock_guard lock(timers_mutex_);
    if (reconnect_task_) {
        scheduler_.cancel(*reconnect_task_);
    }
    reconnect_task_ = scheduler_.schedule_after(reconnect_delay_, [this]() { check_and_sync(); });
}

void ReplayEngine::start(infra::Scheduler::Duration interval,
                         infra::Scheduler::Duration reconnect_delay)
{
    stop();

    std::lock_guard lock(timers_mutex_);
    reconnect_delay_ = reconnect_delay;
    periodic_task_ = scheduler_.schedule_every(interval, [this]() { check_and_sync(); });
    subscription_ = connectivity_.subscribe([this](bool online) { on_connectivity(online); });

    Logger::log(LogLevel::INFO, "Sync: Periodic sync every " +
                                    std::to_string(interval.count()) + " ms.");
}

void ReplayEngine::stop()
{
    {
        std::lock_guard lock(timers_mutex_);
        if (subscription_) {
            connectivity_.unsubscribe(*subscription_);
            subscription_.reset();
        }
        if (periodic_task_) {
            scheduler_.cancel(*periodic_task_);
            periodic_task_.reset();
        }
        if (reconnect_task_) {
            scheduler_.cancel(*reconnect_task_);
            reconnect_task_.reset();
        }
    }

    std::unique_lock lock(drain_mutex_);
    if (drain_thread_ == std::this_thread::get_id()) {
        // Called from a handler or listener of the running drain.
        return;
    }
    drain_done_.wait(lock, [this]() { return !syncing_.load(); });
}

void ReplayEngine::end_drain()
{
    std::lock_guard lock(drain_mutex_);
    drain_thread_ = std::thread::id();
    syncing_.store(false);
    drain_done_.notify_all();
}

bool ReplayEngine::is_running() const
{
    std::lock_guard lock(timers_mutex_);
    return periodic_task_.has_value();
}

SyncStats ReplayEngine::stats() const
{
    SyncStats stats;
    stats.total_items = queue_.size();
    stats.last_sync_at = flat_.get_item(kLastSyncKey);
    stats.in_flight = syncing_.load();
    return stats;
}

} // namespace aula::sync
