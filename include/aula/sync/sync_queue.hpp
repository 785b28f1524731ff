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
 * @file sync_queue.hpp
 * @brief Ordered record of mutations performed while offline.
 *
 * @details
 * The queue is a single JSON array stored in the flat store under
 * `offline_actions`:
 *
 * @code
 * [ { "id": "<uuid>", "type": "enroll", "data": { "courseId": "c1" },
 *     "timestamp": "2026-01-01T00:00:00.000Z", "userId": "u1" } ]
 * @endcode
 *
 * An item leaves the queue only once the replay engine removes it.
 */

#pragma once

#include "aula/infra/json.hpp"
#include "aula/storage/flat_store.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace aula::sync {

inline constexpr const char* kSyncQueueKey = "offline_actions";

/// @brief Flat key stamped after a drain that synced at least one action.
inline constexpr const char* kLastSyncKey = "lastSyncAt";

/// @brief Action types understood by the default replay handlers.
namespace action {
inline constexpr const char* kEnroll = "enroll";
inline constexpr const char* kQuizSubmission = "quiz_submission";
inline constexpr const char* kVideoProgress = "video_progress";
inline constexpr const char* kProfileUpdate = "profile_update";
} // namespace action

struct SyncAction {
    std::string id;
    std::string type;
    std::string data; ///< Serialized JSON object.
    std::string timestamp;
    std::string user_id;

    /// @brief Parsed `data`; an empty object when it does not parse.
    infra::Json::Ptr payload() const;
};

class SyncQueue {
  public:
    explicit SyncQueue(storage::FlatStore& flat);

    /**
     * @brief Appends an action with a fresh id and timestamp.
     *
     * @throws storage::StoreError when the list cannot be written. Nothing is
     * buffered elsewhere; the caller decides whether to retry.
     */
    SyncAction enqueue(const std::string& type, const cJSON* data, const std::string& user_id);

    /// @brief Snapshot of the queue in insertion order.
    std::vector<SyncAction> pending() const;

    std::size_t size() const;

    /**
     * @brief Removes the listed ids, leaving every other item in place.
     *
     * Items enqueued after the caller's snapshot are preserved.
     *
     * @return Number of items removed.
     */
    std::size_t remove(const std::vector<std::string>& ids);

    void clear();

  private:
    std::vector<SyncAction> load_locked() const;
    void store_locked(const std::vector<SyncAction>& actions);

    storage::FlatStore& flat_;
    mutable std::mutex mutex_;
};

} // namespace aula::sync
