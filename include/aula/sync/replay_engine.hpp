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
 * @file replay_engine.hpp
 * @brief Applies queued offline actions to the remote API.
 *
 * @details
 * Each queued action moves `Queued -> Applying -> Applied` (removed from the
 * queue) or `Queued -> Applying -> Failed` (left queued). What "left queued"
 * means for a mixed batch is decided by the `CommitPolicy`.
 *
 * A drain is triggered explicitly, by a periodic timer while online, and by
 * the offline-to-online transition after a short settling delay. Only one
 * drain runs at a time; a concurrent request is refused, not queued.
 */

#pragma once

#include "aula/infra/scheduler.hpp"
#include "aula/offline/connectivity.hpp"
#include "aula/storage/flat_store.hpp"
#include "aula/sync/commit_policy.hpp"
#include "aula/sync/remote_api.hpp"
#include "aula/sync/sync_queue.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace aula::sync {

struct SyncResult {
    bool success = true; ///< false when the drain was refused or could not commit.
    std::size_t synced = 0;
    std::size_t failed = 0;
    std::vector<std::string> errors;
};

struct SyncStats {
    std::size_t total_items = 0;
    std::optional<std::string> last_sync_at;
    bool in_flight = false;
};

class ReplayEngine {
  public:
    /// @brief Applies one action; returns whether the server accepted it.
    using Handler = std::function<bool(const SyncAction&)>;
    using Listener = std::function<void(const SyncResult&)>;
    using ListenerId = std::uint64_t;

    /**
     * @brief Wires the engine and installs handlers for the four built-in
     * action types.
     */
    ReplayEngine(SyncQueue& queue, storage::FlatStore& flat, RemoteApi& api,
                 offline::ConnectivityMonitor& connectivity, infra::Scheduler& scheduler,
                 CommitPolicy policy = CommitPolicy::PER_ACTION);

    /// @brief Calls `stop()`.
    ~ReplayEngine();

    ReplayEngine(const ReplayEngine&) = delete;
    ReplayEngine& operator=(const ReplayEngine&) = delete;

    /// @brief Adds or replaces the handler for `type`.
    void register_handler(const std::string& type, Handler handler);

    /// @brief Registers a callback invoked after every drain that processed actions.
    ListenerId add_listener(Listener listener);
    bool remove_listener(ListenerId id);

    /**
     * @brief Runs one pass over the queue snapshot.
     *
     * Refused with `success == false` when offline or when another drain is in
     * progress. Handler errors are caught per action so one failure never
     * aborts the rest of the batch.
     */
    SyncResult drain();

    /**
     * @brief Starts the periodic timer and the reconnect trigger.
     *
     * Calling it twice restarts both with the new timings.
     */
    void start(infra::Scheduler::Duration interval, infra::Scheduler::Duration reconnect_delay);

    /**
     * @brief Cancels timers and the connectivity subscription, then waits for
     * a running drain to finish.
     *
     * From inside a handler or listener of that drain it returns without waiting.
     */
    void stop();

    bool is_running() const;
    bool is_syncing() const { return syncing_.load(); }

    SyncStats stats() const;
    CommitPolicy commit_policy() const { return policy_; }

  private:
    void install_default_handlers();

    /// @brief Drains only if online, idle, and something is queued.
    void check_and_sync();

    void on_connectivity(bool online);
    void commit(const std::vector<std::string>& applied, SyncResult& result);
    void notify(const SyncResult& result);
    void end_drain();

    SyncQueue& queue_;
    storage::FlatStore& flat_;
    RemoteApi& api_;
    offline::ConnectivityMonitor& connectivity_;
    infra::Scheduler& scheduler_;
    const CommitPolicy policy_;

    std::atomic<bool> syncing_{false};
    std::mutex drain_mutex_;
    std::condition_variable drain_done_;
    std::thread::id drain_thread_;

    mutable std::mutex handlers_mutex_;
    std::unordered_map<std::string, Handler> handlers_;

    std::mutex listeners_mutex_;
    std::map<ListenerId, Listener> listeners_;
    ListenerId next_listener_id_ = 1;

    mutable std::mutex timers_mutex_;
    std::optional<infra::Scheduler::TaskId> periodic_task_;
    std::optional<infra::Scheduler::TaskId> reconnect_task_;
    std::optional<offline::ConnectivityMonitor::ListenerId> subscription_;
    infra::Scheduler::Duration reconnect_delay_{0};
};

} // namespace aula::sync
