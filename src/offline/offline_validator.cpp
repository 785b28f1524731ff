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
 * @file offline_validator.cpp
 * @brief Implementation of the offline readiness checks.
 */

#include "aula/offline/offline_validator.hpp"

#include "aula/infra/logger.hpp"
#include "aula/storage/errors.hpp"
#include "aula/sync/sync_queue.hpp"

namespace aula::offline {

OfflineValidator::OfflineValidator(cache::EntityCache& entities, storage::FlatStore& flat,
                                   const ConnectivityMonitor& connectivity)
    : entities_(entities), flat_(flat), connectivity_(connectivity)
{
}

ValidationReport OfflineValidator::validate_offline_data()
{
    ValidationReport report;
    storage::DocumentStore& store = entities_.store();

    bool has_identity = entities_.shadow_user().has_value();
    bool has_courses = false;

    try {
        has_courses = !store.all_docs_with_prefix(cache::kCoursePrefix).empty();
        if (!has_identity) {
            has_identity = !store.all_docs_with_prefix(cache::kUserPrefix).empty();
        }
    } catch (const storage::StoreError& e) {
        report.issues.push_back(e.is_unavailable() ? "Local database not available"
                                                   : "Failed to check cached courses");
        infra::Logger::log(infra::LogLevel::WARN,
                           std::string("Offline: Validation could not read the store: ") + e.what());
    }

    if (!has_identity) {
        report.issues.insert(report.issues.begin(), "No cached user found");
    }
    if (!has_courses) {
        report.issues.push_back("No cached courses found");
    }

    report.is_valid = report.issues.empty();
    report.can_proceed = has_identity || has_courses;
    return report;
}

EssentialStatus OfflineValidator::essential_status()
{
    EssentialStatus status;
    storage::DocumentStore& store = entities_.store();

    status.is_offline = !connectivity_.is_online();
    status.cached_user = entities_.shadow_user();
    status.has_local_data = status.cached_user.has_value() && !status.cached_user->email.empty();
    status.last_sync = flat_.get_item(sync::kLastSyncKey);

    switch (store.state()) {
    case storage::StoreState::READY:
        status.database_status = "ready";
        break;
    case storage::StoreState::FALLBACK_READY:
        status.database_status = "fallback";
        break;
    case storage::StoreState::UNINITIALIZED:
    case storage::StoreState::INITIALIZING:
        status.database_status = "initializing";
        break;
    default:
        status.database_status = "failed";
        break;
    }

    try {
        status.has_cached_courses = !store.all_docs_with_prefix(cache::kCoursePrefix).empty();
    } catch (const storage::StoreError& e) {
        status.has_cached_courses = false;
        infra::Logger::log(infra::LogLevel::DEBUG,
                           std::string("Offline: Course check failed: ") + e.what());
    }

    bool store_usable = status.database_status == "ready" || status.database_status == "fallback";
    status.can_access_courses =
        status.is_offline && status.has_local_data && status.has_cached_courses && store_usable;
    return status;
}

} // namespace aula::offline
