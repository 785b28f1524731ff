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
 * @file client.cpp
 * @brief Wiring and learner operations of the offline client.
 */

#include "aula/client.hpp"

#include "aula/infra/clock.hpp"
#include "aula/infra/logger.hpp"
#include "aula/storage/errors.hpp"
#include "aula/storage/log_engine.hpp"
#include "aula/sync/http_remote_api.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace aula {

using infra::Json;
using infra::Logger;
using infra::LogLevel;

OfflineClient::OfflineClient(Config config, std::unique_ptr<sync::RemoteApi> api)
    : config_(std::move(config)), api_(std::move(api))
{
    flat_ = std::make_unique<storage::FlatStore>(config_.flat_store_path(),
                                                 config_.flat_quota_bytes);

    storage::LogEngineOptions engine_options;
    engine_options.base_path = config_.data_dir;
    engine_options.name = config_.database_name;
    engine_options.quota_bytes = config_.storage_quota_bytes;

    storage::StoreOptions store_options;
    store_options.max_attempts = config_.init_max_attempts;
    store_options.backoff = config_.init_backoff;
    store_options.fallback_enabled = config_.fallback_enabled;

    store_ = std::make_unique<storage::DocumentStore>(
        [engine_options]() { return std::make_unique<storage::LogEngine>(engine_options); },
        store_options);

    entities_ = std::make_unique<cache::EntityCache>(*store_, *flat_);
    learner_ = std::make_unique<cache::LearnerCache>(*entities_, *flat_);
    progress_ = std::make_unique<progress::ProgressLedger>(*store_, *flat_);
    connectivity_ = std::make_unique<offline::ConnectivityMonitor>();
    auth_ = std::make_unique<offline::OfflineAuthenticator>(*entities_, *flat_);
    validator_ = std::make_unique<offline::OfflineValidator>(*entities_, *flat_, *connectivity_);
    versions_ = std::make_unique<offline::CacheVersionManager>(*entities_, *flat_);
    queue_ = std::make_unique<sync::SyncQueue>(*flat_);

    if (!api_) {
        api_ = std::make_unique<sync::HttpRemoteApi>(config_.api_base_url, config_.api_timeout_ms);
    }

    scheduler_ = std::make_unique<infra::Scheduler>(1);
    replay_ = std::make_unique<sync::ReplayEngine>(*queue_, *flat_, *api_, *connectivity_,
                                                   *scheduler_, config_.commit_policy);
}

OfflineClient::~OfflineClient()
{
    shutdown();
}

InitResult OfflineClient::init()
{
    Logger::set_level(config_.log_level);
    Logger::log(LogLevel::INFO, "Client: Initializing offline essentials in '" + config_.data_dir +
                                    "'.");

    InitResult result;
    std::error_code ec;
    fs::create_directories(config_.data_dir, ec);
    if (ec) {
        Logger::log(LogLevel::WARN, "Client: Cannot create data directory '" + config_.data_dir +
                                        "': " + ec.message());
    }
    flat_->load();
    result.store_state = store_->init();

    try {
        result.version = versions_->initialize();
    } catch (const storage::StoreError& e) {
        result.message = std::string("Initialization failed: ") + e.what();
        Logger::log(LogLevel::ERROR, "Client: " + result.message);
        return result;
    }

    if (result.store_state == storage::StoreState::UNAVAILABLE) {
        result.message = "Offline data unavailable";
        Logger::log(LogLevel::ERROR, "Client: " + result.message + ": " + store_->last_error());
    } else {
        offline::ValidationReport validation = validator_->validate_offline_data();
        std::size_t cached_courses = 0;
        try {
            cached_courses = entities_->get_all_cached_courses().size();
        } catch (const storage::StoreError& e) {
            Logger::log(LogLevel::WARN, std::string("Client: Could not count cached courses: ") +
                                            e.what());
        }

        result.success = true;
        result.offline_ready = validation.can_proceed && cached_courses > 0;
        result.message =
            "Offline mode ready (" + std::to_string(cached_courses) + " courses cached)";
        Logger::log(LogLevel::INFO, "Client: " + result.message);
    }

    if (scheduler_ && config_.sync_interval.count() > 0) {
        replay_->start(config_.sync_interval, config_.reconnect_delay);
    }
    return result;
}

void OfflineClient::shutdown()
{
    if (!scheduler_) {
        return;
    }
    replay_->stop();
    // Joins the worker; stop() has already waited out a running drain.
    scheduler_.reset();
    Logger::log(LogLevel::INFO, "Client: Background sync stopped.");
}

bool OfflineClient::is_ready() const
{
    return versions_->is_ready();
}

void OfflineClient::require_ready() const
{
    if (!versions_->is_ready()) {
        throw storage::StoreError(storage::ErrorCode::UNAVAILABLE,
                                  "Offline client used before init() completed");
    }
}

progress::ProgressEntry OfflineClient::save_offline_progress(
    const std::string& user_id, const std::string& course_id, const std::string& module_id,
    double percentage, std::int64_t time_spent, bool is_completed,
    std::optional<double> current_position)
{
    require_ready();

    progress::ProgressEntry entry;
    entry.user_id = user_id;
    entry.course_id = course_id;
    entry.lesson_id = module_id;
    entry.module_id = module_id;
    entry.progress.percentage = percentage;
    entry.progress.time_spent = time_spent;
    entry.progress.is_completed = is_completed;
    entry.progress.current_position = current_position;

    try {
        if (auto module = entities_->get_cached_module(module_id)) {
            entry.metadata.module_title = module->title;
            entry.metadata.lesson_title = module->title;
        }
    } catch (const storage::StoreError& e) {
        if (!e.is_unavailable()) {
            throw;
        }
    }

    progress::ProgressEntry saved = progress_->save_progress(entry);

    if (is_completed) {
        try {
            if (auto module = entities_->get_cached_module(module_id)) {
                module->is_completed = true;
                entities_->update_cached_module(*module);
            }
        } catch (const storage::StoreError& e) {
            if (!e.is_unavailable()) {
                throw;
            }
            Logger::log(LogLevel::WARN, "Client: Could not mark module " + module_id +
                                            " completed in cache: " + e.what());
        }
    }
    return saved;
}

progress::ProgressEntry OfflineClient::complete_offline_module(const std::string& user_id,
                                                               const std::string& course_id,
                                                               const std::string& module_id)
{
    Logger::log(LogLevel::INFO, "Client: Completing module " + module_id + " offline.");
    return save_offline_progress(user_id, course_id, module_id, 100.0, 0, true);
}

sync::SyncAction OfflineClient::record_video_progress(const std::string& user_id,
                                                      const std::string& course_id,
                                                      const std::string& lesson_id,
                                                      double percentage, std::int64_t time_spent,
                                                      std::optional<double> current_position)
{
    progress::ProgressEntry saved = save_offline_progress(
        user_id, course_id, lesson_id, percentage, time_spent, percentage >= 100.0,
        current_position);

    Json::Ptr data = Json::object();
    Json::set_string(data.get(), "courseId", course_id);
    Json::set_string(data.get(), "lessonId", lesson_id);
    Json::set_number(data.get(), "percentage", percentage);
    Json::set_number(data.get(), "timeSpent", static_cast<double>(time_spent));
    Json::set_string(data.get(), "lastAccessed", saved.progress.last_updated);

    std::vector<std::string> completed;
    if (auto course = progress_->get_course_progress(user_id, course_id)) {
        for (const auto& [lesson, lesson_progress] : course->lessons) {
            if (lesson_progress.is_completed) {
                completed.push_back(lesson);
            }
        }
    }
    Json::set_string_array(data.get(), "completedLessons", completed);

    return queue_->enqueue(sync::action::kVideoProgress, data.get(), user_id);
}

sync::SyncAction OfflineClient::enroll_offline(const std::string& user_id,
                                               const std::string& course_id)
{
    require_ready();

    std::string now = infra::Clock::now_iso8601();
    Json::Ptr data = Json::object();
    Json::set_string(data.get(), "courseId", course_id);
    Json::set_string(data.get(), "enrolledAt", now);
    Json::set_string(data.get(), "status", "active");
    sync::SyncAction queued = queue_->enqueue(sync::action::kEnroll, data.get(), user_id);

    try {
        if (auto course = entities_->get_course_offline(course_id)) {
            if (!course->enrollment) {
                cache::Enrollment enrollment;
                enrollment.enrolled_at = now;
                enrollment.status = "active";
                course->enrollment = enrollment;
            }
            course->is_enrolled = true;
            entities_->update_cached_course(*course);
        }
    } catch (const storage::StoreError& e) {
        if (!e.is_unavailable()) {
            throw;
        }
        Logger::log(LogLevel::WARN, "Client: Could not flag course " + course_id +
                                        " as enrolled: " + e.what());
    }
    return queued;
}

sync::SyncAction OfflineClient::submit_quiz_offline(const std::string& user_id,
                                                    const std::string& course_id,
                                                    const std::string& quiz_id,
                                                    const cJSON* answers, double score,
                                                    std::int64_t time_spent)
{
    require_ready();

    Json::Ptr data = Json::object();
    Json::set_string(data.get(), "courseId", course_id);
    Json::set_string(data.get(), "quizId", quiz_id);
    Json::set_item(data.get(), "answers", answers ? Json::clone(answers) : Json::array());
    Json::set_number(data.get(), "score", score);
    Json::set_number(data.get(), "timeSpent", static_cast<double>(time_spent));
    Json::set_string(data.get(), "submittedAt", infra::Clock::now_iso8601());
    return queue_->enqueue(sync::action::kQuizSubmission, data.get(), user_id);
}

sync::SyncAction OfflineClient::update_profile_offline(const std::string& user_id,
                                                       const cJSON* profile)
{
    require_ready();

    Json::Ptr data = profile ? Json::clone(profile) : Json::object();
    sync::SyncAction queued = queue_->enqueue(sync::action::kProfileUpdate, data.get(), user_id);

    try {
        if (auto user = entities_->get_cached_user(user_id)) {
            user->name = Json::get_string(data.get(), "name", user->name);
            user->email = Json::get_string(data.get(), "email", user->email);
            if (auto avatar = Json::get_optional_string(data.get(), "avatar")) {
                user->avatar = avatar;
            }
            entities_->update_cached_user(*user);
        }
    } catch (const storage::StoreError& e) {
        if (!e.is_unavailable()) {
            throw;
        }
        Logger::log(LogLevel::WARN, "Client: Could not merge profile into cache: " +
                                        std::string(e.what()));
    }
    return queued;
}

std::optional<OfflineCourseData> OfflineClient::get_offline_course_data(
    const std::string& course_id)
{
    require_ready();

    std::optional<cache::Course> course;
    OfflineCourseData data;
    try {
        course = entities_->get_course_offline(course_id);
        if (course) {
            data.modules = entities_->get_cached_modules_by_course(course->id);
        }
    } catch (const storage::StoreError& e) {
        if (!e.is_unavailable()) {
            throw;
        }
        Logger::log(LogLevel::WARN, "Client: Course data unavailable offline: " + course_id);
        return std::nullopt;
    }
    if (!course) {
        Logger::log(LogLevel::DEBUG, "Client: Course not cached: " + course_id);
        return std::nullopt;
    }

    if (auto user_id = flat_->get_item(cache::shadow::kUserId)) {
        data.progress = progress_->get_course_progress(*user_id, course->id);
    }
    data.course = std::move(*course);
    return data;
}

sync::SyncResult OfflineClient::sync_now()
{
    require_ready();
    return replay_->drain();
}

void OfflineClient::logout_clear()
{
    require_ready();

    try {
        store_->destroy();
    } catch (const storage::StoreError& e) {
        if (!e.is_unavailable()) {
            throw;
        }
    }
    entities_->clear_identity_shadow();
    queue_->clear();
    for (const auto& key : flat_->keys_with_prefix(progress::kProgressPrefix)) {
        flat_->remove_item(key);
    }
    flat_->remove_item(sync::kLastSyncKey);
    flat_->remove_item(offline::kOfflineLoginTimeKey);
    Logger::log(LogLevel::INFO, "Client: Offline data cleared on logout.");
}

storage::DocumentStore& OfflineClient::store()
{
    return *store_;
}

storage::FlatStore& OfflineClient::flat()
{
    return *flat_;
}

cache::EntityCache& OfflineClient::entities()
{
    require_ready();
    return *entities_;
}

cache::LearnerCache& OfflineClient::learner()
{
    require_ready();
    return *learner_;
}

progress::ProgressLedger& OfflineClient::ledger()
{
    require_ready();
    return *progress_;
}

offline::OfflineAuthenticator& OfflineClient::auth()
{
    require_ready();
    return *auth_;
}

offline::OfflineValidator& OfflineClient::validator()
{
    require_ready();
    return *validator_;
}

offline::CacheVersionManager& OfflineClient::versions()
{
    return *versions_;
}

sync::SyncQueue& OfflineClient::queue()
{
    require_ready();
    return *queue_;
}

sync::ReplayEngine& OfflineClient::replay()
{
    require_ready();
    return *replay_;
}

} // namespace aula
