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
 * @file cache_version.cpp
 * @brief Implementation of cache versioning.
 */

#include "aula/offline/cache_version.hpp"

#include "aula/cache/learner_cache.hpp"
#include "aula/infra/clock.hpp"
#include "aula/infra/logger.hpp"
#include "aula/storage/errors.hpp"

#include <set>

namespace aula::offline {

const char* to_string(VersionOutcome outcome)
{
    switch (outcome) {
    case VersionOutcome::FRESH:
        return "fresh";
    case VersionOutcome::CURRENT:
        return "current";
    case VersionOutcome::MIGRATED:
        return "migrated";
    case VersionOutcome::PURGED:
        return "purged";
    }
    return "unknown";
}

CacheVersionManager::CacheVersionManager(cache::EntityCache& entities, storage::FlatStore& flat,
                                         std::string current_version)
    : entities_(entities), flat_(flat), current_(std::move(current_version))
{
    register_migration("0.9.0", "1.0.0", [](cache::EntityCache& cache) {
        for (auto& course : cache.get_all_cached_courses()) {
            if (!course.offline_accessible) {
                course.offline_accessible = true;
                course.last_cached = infra::Clock::now_iso8601();
                cache.update_cached_course(course);
            }
        }
    });
}

void CacheVersionManager::register_migration(const std::string& from, const std::string& to,
                                             Migration step)
{
    migrations_[from] = std::make_pair(to, std::move(step));
}

std::optional<std::string> CacheVersionManager::stored_version() const
{
    return flat_.get_item(cache::kCacheVersionKey);
}

/// @brief Stores the current version. A failed write only repeats the check next start.
void CacheVersionManager::write_marker()
{
    try {
        flat_.set_item(cache::kCacheVersionKey, current_);
    } catch (const storage::StoreError& e) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           std::string("Offline: Cannot record cache version: ") + e.what());
    }
}

/// @brief Clears entity caches. With no usable store there is nothing stale to read.
void CacheVersionManager::purge()
{
    try {
        entities_.clear_all_cached_users();
        entities_.clear_all_cached_courses();
        entities_.clear_all_cached_modules();
        entities_.clear_all_cached_attachments();
        entities_.store().remove_if_present(cache::kLearnerMetadataKey);
    } catch (const storage::StoreError& e) {
        if (!e.is_unavailable()) {
            throw;
        }
        infra::Logger::log(infra::LogLevel::WARN,
                           "Offline: Store unavailable; nothing to purge.");
    }
}

VersionOutcome CacheVersionManager::initialize()
{
    std::optional<std::string> stored = stored_version();

    if (!stored) {
        write_marker();
        infra::Logger::log(infra::LogLevel::INFO, "Offline: Cache version initialized to " + current_);
        ready_ = true;
        return VersionOutcome::FRESH;
    }

    if (*stored == current_) {
        ready_ = true;
        return VersionOutcome::CURRENT;
    }

    infra::Logger::log(infra::LogLevel::INFO,
                       "Offline: Cache version mismatch " + *stored + " -> " + current_);

    VersionOutcome outcome = VersionOutcome::MIGRATED;
    std::string version = *stored;
    std::set<std::string> visited;

    try {
        while (version != current_) {
            auto it = migrations_.find(version);
            if (it == migrations_.end() || !visited.insert(version).second) {
                infra::Logger::log(infra::LogLevel::WARN,
                                   "Offline: No migration from " + version + "; purging entity caches.");
                purge();
                outcome = VersionOutcome::PURGED;
                break;
            }
            it->second.second(entities_);
            infra::Logger::log(infra::LogLevel::INFO,
                               "Offline: Migrated cache " + version + " -> " + it->second.first);
            version = it->second.first;
        }
    } catch (const storage::StoreError& e) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           std::string("Offline: Cache migration failed: ") + e.what());
        purge();
        outcome = VersionOutcome::PURGED;
    }

    write_marker();
    ready_ = true;
    return outcome;
}

} // namespace aula::offline
