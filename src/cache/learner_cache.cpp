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
 * @file learner_cache.cpp
 * @brief Implementation of learner-level caching and maintenance.
 */

#include "aula/cache/learner_cache.hpp"

#include "aula/infra/clock.hpp"
#include "aula/infra/logger.hpp"
#include "aula/infra/string.hpp"
#include "aula/storage/errors.hpp"

#include <chrono>

namespace aula::cache {

using infra::Json;
using infra::String;

LearnerCache::LearnerCache(EntityCache& entities, storage::FlatStore& flat)
    : entities_(entities), flat_(flat)
{
}

void LearnerCache::cache_learner_data(const User& user, const std::vector<Course>& courses)
{
    entities_.cache_user(user);
    for (const auto& course : courses) {
        entities_.cache_course(course);
    }

    std::string now = infra::Clock::now_iso8601();
    entities_.store().upsert(kLearnerMetadataKey, [&](const std::optional<storage::Document>&) {
        Json::Ptr meta = Json::object();
        Json::set_string(meta.get(), "type", "learner_metadata");
        Json::set_string(meta.get(), "userId", user.id);
        Json::set_string(meta.get(), "cachedAt", now);
        Json::set_number(meta.get(), "totalEnrolledCourses", static_cast<double>(courses.size()));
        Json::set_string(meta.get(), "lastSync", now);
        Json::set_bool(meta.get(), "offlineEnabled", true);
        return Json::print(meta.get());
    });

    infra::Logger::log(infra::LogLevel::INFO, "Cache: Learner data cached for " + user.name +
                                                  " (" + std::to_string(courses.size()) +
                                                  " courses).");
}

LearnerOfflineStatus LearnerCache::get_learner_offline_status()
{
    LearnerOfflineStatus status;
    std::vector<Course> enrolled = entities_.get_enrolled_courses();
    status.has_offline_data = !enrolled.empty();
    status.enrolled_courses_count = enrolled.size();

    if (auto doc = entities_.store().get(kLearnerMetadataKey)) {
        Json::Ptr meta = Json::parse(doc->body);
        status.last_sync = Json::get_optional_string(meta.get(), "lastSync");
        status.offline_enabled = Json::get_bool(meta.get(), "offlineEnabled");
    }
    return status;
}

void LearnerCache::clear_learner_offline_data()
{
    entities_.clear_all_cached_courses();
    entities_.store().remove_if_present(kLearnerMetadataKey);
    infra::Logger::log(infra::LogLevel::INFO, "Cache: Learner offline data cleared.");
}

CacheStats LearnerCache::get_cache_stats()
{
    CacheStats stats;
    stats.version = flat_.get_item(kCacheVersionKey).value_or("unknown");

    for (const auto& doc : entities_.store().all_docs()) {
        ++stats.total_documents;
        stats.total_size += doc.body.size();

        if (String::starts_with(doc.key, kUserPrefix))
            ++stats.user_count;
        else if (String::starts_with(doc.key, kCoursePrefix))
            ++stats.course_count;
        else if (String::starts_with(doc.key, kModulePrefix))
            ++stats.module_count;
        else if (String::starts_with(doc.key, kAttachmentPrefix))
            ++stats.attachment_count;
        else if (String::starts_with(doc.key, "progress_"))
            ++stats.progress_count;
    }

    storage::EngineInfo info = entities_.store().info();
    stats.engine = info.engine;
    stats.is_fallback = info.is_fallback;
    return stats;
}

CleanupResult LearnerCache::cleanup_old_cache_data(int max_age_days)
{
    CleanupResult result;
    auto cutoff = std::chrono::system_clock::now() - std::chrono::hours(24) * max_age_days;

    for (const auto& doc : entities_.store().all_docs()) {
        std::size_t* counter = nullptr;
        if (String::starts_with(doc.key, kUserPrefix))
            counter = &result.cleaned_users;
        else if (String::starts_with(doc.key, kCoursePrefix))
            counter = &result.cleaned_courses;
        else if (String::starts_with(doc.key, kModulePrefix))
            counter = &result.cleaned_modules;
        else if (String::starts_with(doc.key, kAttachmentPrefix))
            counter = &result.cleaned_attachments;
        if (!counter || !doc.revision) {
            continue;
        }

        Json::Ptr envelope = Json::parse(doc.body);
        std::string stamp = Json::get_string(envelope.get(), "lastUpdated",
                                             Json::get_string(envelope.get(), "cachedAt"));
        auto updated = infra::Clock::parse_iso8601(stamp);
        if (!updated || *updated >= cutoff) {
            continue;
        }

        try {
            if (entities_.store().remove(doc.key, *doc.revision)) {
                ++*counter;
            }
        } catch (const storage::StoreError& e) {
            ++result.failed;
            infra::Logger::log(infra::LogLevel::WARN, "Cache: Failed to remove old document " +
                                                          doc.key + ": " + e.what());
        }
    }

    infra::Logger::log(infra::LogLevel::INFO,
                       "Cache: Cleanup removed " + std::to_string(result.cleaned_courses) +
                           " courses, " + std::to_string(result.cleaned_modules) + " modules, " +
                           std::to_string(result.cleaned_users) + " users, " +
                           std::to_string(result.cleaned_attachments) + " attachments.");
    return result;
}

} // namespace aula::cache
