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
 * @file client_test.cpp
 * @brief Integration tests driving the offline client facade end to end.
 */

#include "aula/client.hpp"
#include "aula/infra/json.hpp"
#include "fake_remote_api.hpp"
#include "framework.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

using namespace aula;
using aula::infra::Json;
using aula::storage::ErrorCode;
using aula::storage::StoreState;
using aula::test::FakeRemoteApi;
using aula::test::store_error_code;

namespace {

const char* kClientDir = "./test_client_data";

Config test_config(const std::string& dir)
{
    Config config;
    config.data_dir = dir;
    config.init_backoff = std::chrono::milliseconds(0);
    config.sync_interval = std::chrono::milliseconds(0);
    config.log_level = infra::LogLevel::WARN;
    return config;
}

/// @brief Client over a fake server; the raw pointer stays valid for the client's lifetime.
struct ClientHarness {
    aula::test::ScratchDir dir{kClientDir};
    FakeRemoteApi* api = nullptr;
    std::unique_ptr<OfflineClient> client;

    ClientHarness()
    {
        auto fake = std::make_unique<FakeRemoteApi>();
        api = fake.get();
        client = std::make_unique<OfflineClient>(test_config(dir.path), std::move(fake));
    }

    void seed_course()
    {
        cache::Course course;
        course.id = "c1";
        course.title = "Systems Programming";
        client->entities().cache_course(course);
        for (int i = 1; i <= 2; ++i) {
            cache::Module module;
            module.id = "m" + std::to_string(i);
            module.course_id = "c1";
            module.title = "Part " + std::to_string(i);
            module.order = i;
            client->entities().cache_module(module);
        }
        client->entities().cache_user(cache::User{"u1", "Ada", "ada@example.com",
                                                  cache::UserRole::LEARNER, std::nullopt, true,
                                                  std::nullopt});
    }
};

} // namespace

void test_client_init_ready()
{
    ClientHarness h;
    ASSERT_FALSE(h.client->is_ready());

    InitResult first = h.client->init();
    ASSERT_TRUE(first.success);
    ASSERT_TRUE(first.store_state == StoreState::READY);
    ASSERT_TRUE(first.version == offline::VersionOutcome::FRESH);
    ASSERT_FALSE(first.offline_ready);
    ASSERT_EQ(first.message, std::string("Offline mode ready (0 courses cached)"));

    h.seed_course();
    h.client->shutdown();
    h.client.reset();

    // Reopen over the same directory: the log engine and the flat file persist.
    h.client = std::make_unique<OfflineClient>(test_config(h.dir.path),
                                               std::make_unique<FakeRemoteApi>());
    InitResult second = h.client->init();
    ASSERT_TRUE(second.success);
    ASSERT_TRUE(second.offline_ready);
    ASSERT_TRUE(second.version == offline::VersionOutcome::CURRENT);
    ASSERT_EQ(second.message, std::string("Offline mode ready (1 courses cached)"));
}

void test_client_refuses_before_init()
{
    ClientHarness h;
    ASSERT_TRUE(store_error_code([&]() { h.client->enroll_offline("u1", "c1"); }) ==
                ErrorCode::UNAVAILABLE);
    ASSERT_TRUE(store_error_code([&]() { h.client->entities(); }) == ErrorCode::UNAVAILABLE);
    ASSERT_TRUE(store_error_code([&]() { h.client->sync_now(); }) == ErrorCode::UNAVAILABLE);

    // The connectivity feed is always accepted.
    h.client->connectivity().set_online(false);
    ASSERT_FALSE(h.client->connectivity().is_online());
}

/**
 * @brief An unusable store leaves the client running in read-only mode.
 */
void test_client_init_unavailable()
{
    aula::test::ScratchDir dir(kClientDir);
    {
        std::ofstream blocker(dir.file("blocker"));
        blocker << "not a directory";
    }

    Config config = test_config(dir.file("blocker") + "/data");
    config.init_max_attempts = 1;
    config.fallback_enabled = false;

    OfflineClient client(config, std::make_unique<FakeRemoteApi>());
    InitResult result = client.init();
    ASSERT_FALSE(result.success);
    ASSERT_FALSE(result.offline_ready);
    ASSERT_TRUE(result.store_state == StoreState::UNAVAILABLE);
    ASSERT_EQ(result.message, std::string("Offline data unavailable"));
    ASSERT_TRUE(client.is_ready());

    ASSERT_FALSE(client.get_offline_course_data("c1").has_value());
    ASSERT_FALSE(client.validator().essential_status().can_access_courses);
}

void test_client_complete_module()
{
    ClientHarness h;
    h.client->init();
    h.seed_course();

    progress::ProgressEntry saved = h.client->complete_offline_module("u1", "c1", "m1");
    ASSERT_TRUE(saved.progress.is_completed);
    ASSERT_EQ(saved.metadata.module_title.value_or(""), std::string("Part 1"));
    ASSERT_TRUE(h.client->entities().get_cached_module("m1")->is_completed);
    ASSERT_FALSE(h.client->entities().get_cached_module("m2")->is_completed);

    h.client->save_offline_progress("u1", "c1", "m2", 30, 120, false, 42.5);
    auto data = h.client->get_offline_course_data("c1");
    ASSERT_TRUE(data.has_value());
    ASSERT_EQ(data->modules.size(), static_cast<size_t>(2));
    ASSERT_TRUE(data->progress.has_value());
    ASSERT_EQ(data->progress->completed_lessons, 1);
    ASSERT_EQ(data->progress->overall_percentage, 50);
}

/**
 * @brief Enrollment is visible locally at once and replayed later.
 */
void test_client_enroll_and_sync()
{
    ClientHarness h;
    h.client->init();
    h.seed_course();
    h.client->connectivity().set_online(false);

    sync::SyncAction queued = h.client->enroll_offline("u1", "c1");
    ASSERT_EQ(queued.type, std::string(sync::action::kEnroll));

    auto course = h.client->entities().get_cached_course("c1");
    ASSERT_TRUE(course->is_enrolled);
    ASSERT_TRUE(course->enrollment.has_value());
    ASSERT_EQ(course->enrollment->status, std::string("active"));
    ASSERT_EQ(h.client->entities().get_enrolled_courses().size(), static_cast<size_t>(1));

    ASSERT_FALSE(h.client->sync_now().success);
    ASSERT_EQ(h.client->queue().size(), static_cast<size_t>(1));

    h.client->connectivity().set_online(true);
    sync::SyncResult result = h.client->sync_now();
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.synced, static_cast<size_t>(1));
    ASSERT_EQ(h.client->queue().size(), static_cast<size_t>(0));
    ASSERT_EQ(h.api->calls()[0], std::string("enroll:c1"));
}

void test_client_queues_learner_actions()
{
    ClientHarness h;
    h.client->init();
    h.seed_course();

    h.client->record_video_progress("u1", "c1", "m1", 100, 300);
    sync::SyncAction video = h.client->record_video_progress("u1", "c1", "m2", 40, 60, 12.0);
    Json::Ptr video_data = video.payload();
    ASSERT_EQ(Json::get_string_array(video_data.get(), "completedLessons").size(),
              static_cast<size_t>(1));
    ASSERT_FALSE(Json::get_string(video_data.get(), "lastAccessed").empty());

    Json::Ptr answers = Json::array();
    h.client->submit_quiz_offline("u1", "c1", "q1", answers.get(), 90, 200);

    Json::Ptr profile = Json::object();
    Json::set_string(profile.get(), "name", "Ada Lovelace");
    h.client->update_profile_offline("u1", profile.get());
    ASSERT_EQ(h.client->entities().get_cached_user("u1")->name, std::string("Ada Lovelace"));
    ASSERT_EQ(h.client->entities().get_cached_user("u1")->email, std::string("ada@example.com"));

    ASSERT_EQ(h.client->queue().size(), static_cast<size_t>(4));

    sync::SyncResult result = h.client->sync_now();
    ASSERT_EQ(result.synced, static_cast<size_t>(4));
    auto calls = h.api->calls();
    ASSERT_EQ(calls[1], std::string("progress:c1/m2@40"));
    ASSERT_EQ(calls[2], std::string("quiz:c1/q1"));
    ASSERT_EQ(calls[3], std::string("profile:Ada Lovelace"));
}

/**
 * @brief Logout wipes cached data and sync bookkeeping but keeps the version marker.
 */
void test_client_logout_clear()
{
    ClientHarness h;
    h.client->init();
    h.seed_course();
    h.client->complete_offline_module("u1", "c1", "m1");
    h.client->enroll_offline("u1", "c1");
    ASSERT_TRUE(h.client->auth().authenticate_offline("ada@example.com", "").success);

    h.client->logout_clear();

    ASSERT_EQ(h.client->entities().get_all_cached_courses().size(), static_cast<size_t>(0));
    ASSERT_FALSE(h.client->entities().shadow_user().has_value());
    ASSERT_FALSE(h.client->ledger().get_course_progress("u1", "c1").has_value());
    ASSERT_EQ(h.client->queue().size(), static_cast<size_t>(0));
    ASSERT_EQ(h.client->flat().keys_with_prefix(progress::kProgressPrefix).size(),
              static_cast<size_t>(0));
    ASSERT_FALSE(h.client->auth().last_offline_login().has_value());
    ASSERT_TRUE(h.client->versions().stored_version().has_value());

    offline::ValidationReport report = h.client->validator().validate_offline_data();
    ASSERT_FALSE(report.can_proceed);
}

/**
 * @brief A full store fails the learner operation instead of leaving the cache stale.
 */
void test_client_surfaces_quota_on_cache_write()
{
    ClientHarness h;
    h.client->init();
    h.seed_course();
    h.client->shutdown();
    h.client.reset();

    Config config = test_config(h.dir.path);
    config.storage_quota_bytes = std::filesystem::file_size(h.dir.file("aula_local.aev"));
    h.client = std::make_unique<OfflineClient>(config, std::make_unique<FakeRemoteApi>());
    ASSERT_TRUE(h.client->init().success);

    ASSERT_TRUE(store_error_code([&]() { h.client->enroll_offline("u1", "c1"); }) ==
                ErrorCode::QUOTA_EXCEEDED);
    ASSERT_FALSE(h.client->entities().get_cached_course("c1")->is_enrolled);

    Json::Ptr profile = Json::object();
    Json::set_string(profile.get(), "name", "Ada Lovelace");
    ASSERT_TRUE(store_error_code([&]() { h.client->update_profile_offline("u1", profile.get()); }) ==
                ErrorCode::QUOTA_EXCEEDED);
}
