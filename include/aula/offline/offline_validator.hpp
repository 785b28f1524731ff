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
 * @file offline_validator.hpp
 * @brief Readiness checks for running without the network.
 */

#pragma once

#include "aula/cache/entity_cache.hpp"
#include "aula/offline/connectivity.hpp"
#include "aula/storage/flat_store.hpp"

#include <optional>
#include <string>
#include <vector>

namespace aula::offline {

struct ValidationReport {
    bool is_valid = false;           ///< No issues at all.
    std::vector<std::string> issues;
    bool can_proceed = false;        ///< A cached identity or a cached course exists.
};

struct EssentialStatus {
    bool is_offline = false;
    bool has_local_data = false;     ///< Identity shadow present.
    bool has_cached_courses = false;
    bool can_access_courses = false;
    std::string database_status;     ///< `ready`, `fallback`, `initializing` or `failed`.
    std::optional<std::string> last_sync;
    std::optional<cache::User> cached_user;
};

class OfflineValidator {
  public:
    OfflineValidator(cache::EntityCache& entities, storage::FlatStore& flat,
                     const ConnectivityMonitor& connectivity);

    /**
     * @brief Checks for a cached identity and at least one cached course.
     *
     * Degrades rather than refusing: `can_proceed` holds when either exists,
     * even if `is_valid` is false. Never throws for storage failures; they
     * become issues.
     */
    ValidationReport validate_offline_data();

    EssentialStatus essential_status();

  private:
    cache::EntityCache& entities_;
    storage::FlatStore& flat_;
    const ConnectivityMonitor& connectivity_;
};

} // namespace aula::offline
