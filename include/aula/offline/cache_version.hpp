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
 * @file cache_version.hpp
 * @brief Cache format versioning and migrations.
 *
 * @details
 * A single version string is kept in the flat store under `cache_version`.
 * `initialize()` compares it with the version this build writes and, on a
 * mismatch, walks the registered migration chain from the stored version.
 * When no chain reaches the current version, or a step fails, the structured
 * entity caches are purged so that documents of an unknown shape are never
 * read back.
 */

#pragma once

#include "aula/cache/entity_cache.hpp"
#include "aula/storage/flat_store.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace aula::offline {

inline constexpr const char* kCurrentCacheVersion = "1.0.0";

enum class VersionOutcome {
    FRESH,    ///< No marker was stored; it has been written.
    CURRENT,  ///< Marker already matched.
    MIGRATED, ///< Migration chain ran to completion.
    PURGED    ///< Unknown version or failed migration; entity caches cleared.
};

const char* to_string(VersionOutcome outcome);

class CacheVersionManager {
  public:
    /// @brief One step rewriting cached documents from one version to the next.
    using Migration = std::function<void(cache::EntityCache&)>;

    /**
     * @brief Registers the built-in `0.9.0 -> 1.0.0` step (marks every
     * cached course offline-accessible).
     */
    CacheVersionManager(cache::EntityCache& entities, storage::FlatStore& flat,
                        std::string current_version = kCurrentCacheVersion);

    void register_migration(const std::string& from, const std::string& to, Migration step);

    /**
     * @brief Brings the cache to the current version.
     *
     * A marker that cannot be written is logged; the check simply runs again
     * on the next start.
     *
     * @throws storage::StoreError if a purge fails for a reason other than an
     * unavailable store.
     */
    VersionOutcome initialize();

    std::optional<std::string> stored_version() const;
    const std::string& current_version() const { return current_; }

    /// @brief True once `initialize()` has completed.
    bool is_ready() const { return ready_.load(); }

  private:
    void purge();
    void write_marker();

    cache::EntityCache& entities_;
    storage::FlatStore& flat_;
    std::string current_;
    std::map<std::string, std::pair<std::string, Migration>> migrations_;
    std::atomic<bool> ready_{false};
};

} // namespace aula::offline
