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
 * @file client.hpp
 * @brief Offline client facade.
 *
 * @details
 * `OfflineClient` owns one instance of every offline component and wires them
 * from a `Config`. Its lifecycle is explicit:
 * 1. Construction (no I/O).
 * 2. `init()`: loads the flat store, opens the document store (retrying, then
 *    falling back), runs cache versioning and starts the sync timers.
 * 3. `shutdown()`: stops the sync timers and joins the scheduler.
 *
 * Every operation other than the connectivity feed is refused with
 * `StoreError(UNAVAILABLE)` until `init()` has completed cache versioning.
 */

#pragma once

#include "aula/cache/entity_cache.hpp"
#include "aula/cache/learner_cache.hpp"
#include "aula/config.hpp"
#include "aula/infra/scheduler.hpp"
#include "aula/offline/cache_version.hpp"
#include "aula/offline/connectivity.hpp"
#include "aula/offline/offline_auth.hpp"
#include "aula/offline/offline_validator.hpp"
#include "aula/progress/progress_ledger.hpp"
#include "aula/storage/document_store.hpp"
#include "aula/storage/flat_store.hpp"
#include "aula/sync/remote_api.hpp"
#include "aula/sync/replay_engine.hpp"
#include "aula/sync/sync_queue.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace aula {

struct InitResult {
    bool success = false;
    std::string message;
    bool offline_ready = false; ///< Usable offline: something cached and validation passes.
    storage::StoreState store_state = storage::StoreState::UNINITIALIZED;
    offline::VersionOutcome version = offline::VersionOutcome::CURRENT;
};

/// @brief Everything needed to open one course without the network.
struct OfflineCourseData {
    cache::Course course;
    std::vector<cache::Module> modules;
    std::optional<progress::CourseProgress> progress;
};

class OfflineClient {
  public:
    /**
     * @param api Remote collaborator; `HttpRemoteApi` over `config.api_base_url`
     *            when null.
     */
    explicit OfflineClient(Config config, std::unique_ptr<sync::RemoteApi> api = nullptr);

    /// @brief Calls `shutdown()`.
    ~OfflineClient();

    OfflineClient(const OfflineClient&) = delete;
    OfflineClient& operator=(const OfflineClient&) = delete;

    /**
     * @brief Brings every component up. Never throws for an unusable store:
     * the result reports `UNAVAILABLE` and the client stays in read-only mode.
     */
    InitResult init();

    /// @brief Stops background sync. Safe to call repeatedly.
    void shutdown();

    bool is_ready() const;

    // ========================================================================
    //  LEARNER OPERATIONS
    // ========================================================================

    /**
     * @brief Records progress on one module; a completed module is also marked
     * completed in the module cache.
     *
     * @throws storage::StoreError when neither store can take the write.
     */
    progress::ProgressEntry save_offline_progress(const std::string& user_id,
                                                  const std::string& course_id,
                                                  const std::string& module_id, double percentage,
                                                  std::int64_t time_spent, bool is_completed,
                                                  std::optional<double> current_position = {});

    progress::ProgressEntry complete_offline_module(const std::string& user_id,
                                                    const std::string& course_id,
                                                    const std::string& module_id);

    /**
     * @brief Saves video progress locally and queues it for the server.
     */
    sync::SyncAction record_video_progress(const std::string& user_id,
                                           const std::string& course_id,
                                           const std::string& lesson_id, double percentage,
                                           std::int64_t time_spent,
                                           std::optional<double> current_position = {});

    /**
     * @brief Queues an enrollment and flags the cached course as enrolled.
     */
    sync::SyncAction enroll_offline(const std::string& user_id, const std::string& course_id);

    sync::SyncAction submit_quiz_offline(const std::string& user_id, const std::string& course_id,
                                         const std::string& quiz_id, const cJSON* answers,
                                         double score, std::int64_t time_spent);

    /**
     * @brief Queues a profile delta and merges `name`, `email` and `avatar`
     * into the cached user.
     */
    sync::SyncAction update_profile_offline(const std::string& user_id, const cJSON* profile);

    /// @brief Course, its modules and the current user's progress, if cached.
    std::optional<OfflineCourseData> get_offline_course_data(const std::string& course_id);

    /// @brief Immediate drain of the sync queue.
    sync::SyncResult sync_now();

    /**
     * @brief Logout: wipes cached documents, the identity shadow, the sync
     * queue and the sync bookkeeping. The cache version marker is kept.
     */
    void logout_clear();

    // ========================================================================
    //  COMPONENTS
    // ========================================================================

    const Config& config() const { return config_; }
    offline::ConnectivityMonitor& connectivity() { return *connectivity_; }

    storage::DocumentStore& store();
    storage::FlatStore& flat();
    cache::EntityCache& entities();
    cache::LearnerCache& learner();
    progress::ProgressLedger& ledger();
    offline::OfflineAuthenticator& auth();
    offline::OfflineValidator& validator();
    offline::CacheVersionManager& versions();
    sync::SyncQueue& queue();
    sync::ReplayEngine& replay();

  private:
    void require_ready() const;

    Config config_;

    std::unique_ptr<storage::FlatStore> flat_;
    std::unique_ptr<storage::DocumentStore> store_;
    std::unique_ptr<cache::EntityCache> entities_;
    std::unique_ptr<cache::LearnerCache> learner_;
    std::unique_ptr<progress::ProgressLedger> progress_;
    std::unique_ptr<offline::ConnectivityMonitor> connectivity_;
    std::unique_ptr<offline::OfflineAuthenticator> auth_;
    std::unique_ptr<offline::OfflineValidator> validator_;
    std::unique_ptr<offline::CacheVersionManager> versions_;
    std::unique_ptr<sync::SyncQueue> queue_;
    std::unique_ptr<sync::RemoteApi> api_;
    std::unique_ptr<infra::Scheduler> scheduler_;
    std::unique_ptr<sync::ReplayEngine> replay_;
};

} // namespace aula
