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
 * @file learner_cache.hpp
 * @brief Learner-level bulk caching, status and maintenance.
 */

#pragma once

#include "aula/cache/entity_cache.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace aula::cache {

inline constexpr const char* kLearnerMetadataKey = "learner_metadata";

/// @brief Flat key holding the cache format version.
inline constexpr const char* kCacheVersionKey = "cache_version";

struct LearnerOfflineStatus {
    bool has_offline_data = false;
    std::size_t enrolled_courses_count = 0;
    std::optional<std::string> last_sync;
    bool offline_enabled = false;
};

struct CacheStats {
    std::string version;           ///< `"unknown"` when no marker is stored.
    std::size_t total_documents = 0;
    std::uint64_t total_size = 0;  ///< Sum of document body sizes, in bytes.
    std::size_t user_count = 0;
    std::size_t course_count = 0;
    std::size_t module_count = 0;
    std::size_t attachment_count = 0;
    std::size_t progress_count = 0;
    std::string engine;
    bool is_fallback = false;
};

struct CleanupResult {
    std::size_t cleaned_users = 0;
    std::size_t cleaned_courses = 0;
    std::size_t cleaned_modules = 0;
    std::size_t cleaned_attachments = 0;
    std::size_t failed = 0; ///< Documents that could not be removed.
};

/**
 * @class LearnerCache
 * @brief Operations spanning a whole learner's offline data set.
 */
class LearnerCache {
  public:
    LearnerCache(EntityCache& entities, storage::FlatStore& flat);

    /**
     * @brief Caches the user, every course, and the `learner_metadata` document
     * (`userId`, `cachedAt`, `totalEnrolledCourses`, `lastSync`, `offlineEnabled`).
     */
    void cache_learner_data(const User& user, const std::vector<Course>& courses);

    LearnerOfflineStatus get_learner_offline_status();

    /// @brief Drops every cached course and the learner metadata.
    void clear_learner_offline_data();

    CacheStats get_cache_stats();

    /**
     * @brief Removes entity documents whose `lastUpdated` (or `cachedAt`) is
     * older than `max_age_days`.
     *
     * Progress documents are never touched. A document that cannot be removed
     * is logged and counted in `failed`; the sweep continues.
     */
    CleanupResult cleanup_old_cache_data(int max_age_days = 30);

  private:
    EntityCache& entities_;
    storage::FlatStore& flat_;
};

} // namespace aula::cache
