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
 * @file sync_test.cpp
 * @brief Unit tests for the sync queue and the replay engine.
 */

#include "aula/infra/json.hpp"
#include "aula/infra/scheduler.hpp"
#include "aula/offline/connectivity.hpp"
#include "aula/sync/http_remote_api.hpp"
#include "aula/sync/replay_engine.hpp"
#include "aula/sync/sync_queue.hpp"
#include "fake_remote_api.hpp"
#include "framework.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace aula::sync;
using aula::infra::Json;
using aula::infra::Scheduler;
using aula::offline::ConnectivityMonitor;
using aula::storage::FlatStore;
using aula::test::FakeRemoteApi;

namespace {

SyncAction enqueue_enroll(SyncQueue& queue, const std::string& course_id)
{
    Json::Ptr data = Json::object();
    Json::set_string(data.get(), "courseId", course_id);
    return queue.enqueue(action::kEnroll, data.get(), "u1");
}

/// @brief Engine with timers never started; drains are driven by the test.
struct Harness {
    FlatStore flat;
    SyncQueue queue{flat};
    FakeRemoteApi api;
    ConnectivityMonitor connectivity{true};
    Scheduler scheduler{1};
    std::unique_ptr<ReplayEngine> engine;

    explicit Harness(CommitPolicy policy = CommitPolicy::PER_ACTION)
        : engine(std::make_unique<ReplayEngine>(queue, flat, api, connectivity, scheduler, policy))
    {
    }
};

} // namespace

void test_sync_queue_order_and_ids()
{
    FlatStore flat;
    SyncQueue queue(flat);

    SyncAction a = enqueue_enroll(queue, "c1");
    SyncAction b = enqueue_enroll(queue, "c2");
    ASSERT_NE(a.id, b.id);
    ASSERT_FALSE(a.timestamp.empty());

    auto pending = queue.pending();
    ASSERT_EQ(pending.size(), static_cast<size_t>(2));
    ASSERT_EQ(pending[0].id, a.id);
    ASSERT_EQ(pending[1].user_id, std::string("u1"));
    ASSERT_EQ(Json::get_string(pending[1].payload().get(), "courseId"), std::string("c2"));

    // The list lives in the flat store under one key.
    ASSERT_TRUE(flat.get_item(kSyncQueueKey).has_value());
}

/**
 * @brief Removing a snapshot's ids keeps items enqueued after the snapshot.
 */
void test_sync_queue_remove_preserves_new_items()
{
    FlatStore flat;
    SyncQueue queue(flat);

    enqueue_enroll(queue, "c1");
    SyncAction b = enqueue_enroll(queue, "c2");
    auto snapshot = queue.pending();
    SyncAction c = enqueue_enroll(queue, "c3");

    ASSERT_EQ(queue.remove({snapshot[0].id}), static_cast<size_t>(1));
    auto left = queue.pending();
    ASSERT_EQ(left.size(), static_cast<size_t>(2));
    ASSERT_EQ(left[0].id, b.id);
    ASSERT_EQ(left[1].id, c.id);

    ASSERT_EQ(queue.remove({"not-queued"}), static_cast<size_t>(0));
    queue.clear();
    ASSERT_EQ(queue.size(), static_cast<size_t>(0));
}

void test_sync_queue_survives_garbage()
{
    FlatStore flat;
    flat.set_item(kSyncQueueKey, "not json");
    SyncQueue queue(flat);
    ASSERT_EQ(queue.size(), static_cast<size_t>(0));

    enqueue_enroll(queue, "c1");
    ASSERT_EQ(queue.size(), static_cast<size_t>(1));
}

/**
 * @brief Only confirmed actions leave the queue.
 */
void test_replay_per_action_commit()
{
    Harness h;
    h.api.respond = [](const std::string& call) {
        return call == "enroll:c1" ? aula::test::rejected("full") : aula::test::accepted();
    };

    SyncAction failing = enqueue_enroll(h.queue, "c1");
    enqueue_enroll(h.queue, "c2");

    SyncResult result = h.engine->drain();
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.synced, static_cast<size_t>(1));
    ASSERT_EQ(result.failed, static_cast<size_t>(1));
    ASSERT_EQ(result.errors[0], "Failed to sync enroll: " + failing.id);

    auto left = h.queue.pending();
    ASSERT_EQ(left.size(), static_cast<size_t>(1));
    ASSERT_EQ(left[0].id, failing.id);
    ASSERT_TRUE(h.flat.get_item(kLastSyncKey).has_value());
}

/**
 * @brief The legacy batch rule drops a failed action when another succeeded.
 */
void test_replay_clear_on_any_success()
{
    Harness h(CommitPolicy::CLEAR_ON_ANY_SUCCESS);
    h.api.respond = [](const std::string& call) {
        return call == "enroll:c1" ? aula::test::rejected("full") : aula::test::accepted();
    };

    enqueue_enroll(h.queue, "c1");
    enqueue_enroll(h.queue, "c2");

    SyncResult result = h.engine->drain();
    ASSERT_EQ(result.synced, static_cast<size_t>(1));
    ASSERT_EQ(result.failed, static_cast<size_t>(1));
    ASSERT_EQ(h.queue.size(), static_cast<size_t>(0));
    ASSERT_TRUE(h.engine->commit_policy() == CommitPolicy::CLEAR_ON_ANY_SUCCESS);
}

void test_replay_nothing_accepted()
{
    for (CommitPolicy policy : {CommitPolicy::PER_ACTION, CommitPolicy::CLEAR_ON_ANY_SUCCESS}) {
        Harness h(policy);
        h.api.respond = [](const std::string&) { return aula::test::rejected("down"); };

        enqueue_enroll(h.queue, "c1");
        enqueue_enroll(h.queue, "c2");

        SyncResult result = h.engine->drain();
        ASSERT_EQ(result.synced, static_cast<size_t>(0));
        ASSERT_EQ(result.failed, static_cast<size_t>(2));
        ASSERT_EQ(h.queue.size(), static_cast<size_t>(2));
        ASSERT_FALSE(h.flat.get_item(kLastSyncKey).has_value());
    }
}

/**
 * @brief Each built-in action type reaches its endpoint with its payload.
 */
void test_replay_default_handlers()
{
    Harness h;

    enqueue_enroll(h.queue, "c1");

    Json::Ptr quiz = Json::object();
    Json::set_string(quiz.get(), "courseId", "c1");
    Json::set_string(quiz.get(), "quizId", "q1");
    Json::set_item(quiz.get(), "answers", Json::array());
    Json::set_number(quiz.get(), "score", 80);
    h.queue.enqueue(action::kQuizSubmission, quiz.get(), "u1");

    Json::Ptr video = Json::object();
    Json::set_string(video.get(), "courseId", "c1");
    Json::set_string(video.get(), "lessonId", "l1");
    Json::set_number(video.get(), "percentage", 55);
    h.queue.enqueue(action::kVideoProgress, video.get(), "u1");

    Json::Ptr profile = Json::object();
    Json::set_string(profile.get(), "name", "Ada");
    h.queue.enqueue(action::kProfileUpdate, profile.get(), "u1");

    SyncResult result = h.engine->drain();
    ASSERT_EQ(result.synced, static_cast<size_t>(4));

    auto calls = h.api.calls();
    ASSERT_EQ(calls.size(), static_cast<size_t>(4));
    ASSERT_EQ(calls[0], std::string("enroll:c1"));
    ASSERT_EQ(calls[1], std::string("quiz:c1/q1"));
    ASSERT_EQ(calls[2], std::string("progress:c1/l1@55"));
    ASSERT_EQ(calls[3], std::string("profile:Ada"));
    ASSERT_EQ(h.queue.size(), static_cast<size_t>(0));
}

void test_replay_unknown_type()
{
    Harness h;
    Json::Ptr data = Json::object();
    h.queue.enqueue("bookmark", data.get(), "u1");

    SyncResult result = h.engine->drain();
    ASSERT_EQ(result.failed, static_cast<size_t>(1));
    ASSERT_EQ(result.errors[0], std::string("Unknown sync action type: bookmark"));
    ASSERT_EQ(h.queue.size(), static_cast<size_t>(1));

    h.engine->register_handler("bookmark", [](const SyncAction&) { return true; });
    ASSERT_EQ(h.engine->drain().synced, static_cast<size_t>(1));
    ASSERT_EQ(h.queue.size(), static_cast<size_t>(0));
}

/**
 * @brief A transport failure on one action does not stop the batch.
 */
void test_replay_network_error()
{
    Harness h;
    h.api.respond = [](const std::string& call) -> ApiResponse {
        if (call == "enroll:c1") {
            throw NetworkError("connection refused");
        }
        return aula::test::accepted();
    };

    enqueue_enroll(h.queue, "c1");
    enqueue_enroll(h.queue, "c2");

    SyncResult result = h.engine->drain();
    ASSERT_EQ(result.synced, static_cast<size_t>(1));
    ASSERT_EQ(result.failed, static_cast<size_t>(1));
    ASSERT_EQ(result.errors[0], std::string("Error syncing enroll: connection refused"));
    ASSERT_EQ(h.queue.size(), static_cast<size_t>(1));
    ASSERT_FALSE(h.engine->is_syncing());
}

void test_replay_refused_offline()
{
    Harness h;
    enqueue_enroll(h.queue, "c1");
    h.connectivity.set_online(false);

    SyncResult result = h.engine->drain();
    ASSERT_FALSE(result.success);
    ASSERT_EQ(result.errors[0], std::string("Sync already in progress or offline"));
    ASSERT_EQ(h.queue.size(), static_cast<size_t>(1));
    ASSERT_TRUE(h.api.calls().empty());
}

/**
 * @brief A drain requested while one is running is refused, not nested.
 */
void test_replay_in_flight_guard()
{
    Harness h;
    SyncResult nested;
    bool in_flight_seen = false;
    h.engine->register_handler(action::kEnroll, [&](const SyncAction&) {
        in_flight_seen = h.engine->stats().in_flight;
        nested = h.engine->drain();
        return true;
    });

    enqueue_enroll(h.queue, "c1");
    SyncResult outer = h.engine->drain();

    ASSERT_TRUE(outer.success);
    ASSERT_EQ(outer.synced, static_cast<size_t>(1));
    ASSERT_FALSE(nested.success);
    ASSERT_TRUE(in_flight_seen);
    ASSERT_FALSE(h.engine->is_syncing());
}

/**
 * @brief Handlers may enqueue; those new items survive the commit.
 */
void test_replay_keeps_items_enqueued_during_drain()
{
    Harness h;
    h.engine->register_handler(action::kEnroll, [&](const SyncAction& a) {
        if (aula::infra::Json::get_string(a.payload().get(), "courseId") == "c1") {
            enqueue_enroll(h.queue, "c9");
        }
        return true;
    });

    enqueue_enroll(h.queue, "c1");
    ASSERT_EQ(h.engine->drain().synced, static_cast<size_t>(1));

    auto left = h.queue.pending();
    ASSERT_EQ(left.size(), static_cast<size_t>(1));
    ASSERT_EQ(Json::get_string(left[0].payload().get(), "courseId"), std::string("c9"));
}

void test_replay_listeners_and_stats()
{
    Harness h;
    std::vector<size_t> seen;
    auto id = h.engine->add_listener([&](const SyncResult& r) { seen.push_back(r.synced); });

    // An empty queue does not notify.
    ASSERT_TRUE(h.engine->drain().success);
    ASSERT_TRUE(seen.empty());

    enqueue_enroll(h.queue, "c1");
    enqueue_enroll(h.queue, "c2");
    SyncStats before = h.engine->stats();
    ASSERT_EQ(before.total_items, static_cast<size_t>(2));
    ASSERT_FALSE(before.last_sync_at.has_value());

    h.engine->drain();
    ASSERT_EQ(seen.size(), static_cast<size_t>(1));
    ASSERT_EQ(seen[0], static_cast<size_t>(2));

    SyncStats after = h.engine->stats();
    ASSERT_EQ(after.total_items, static_cast<size_t>(0));
    ASSERT_TRUE(after.last_sync_at.has_value());
    ASSERT_FALSE(after.in_flight);

    ASSERT_TRUE(h.engine->remove_listener(id));
    ASSERT_FALSE(h.engine->remove_listener(id));
}

/**
 * @brief Coming back online drains the queue after the settling delay.
 */
void test_replay_reconnect_trigger()
{
    FlatStore flat;
    SyncQueue queue(flat);
    FakeRemoteApi api;
    ConnectivityMonitor connectivity(false);
    auto scheduler = std::make_unique<Scheduler>(1);
    ReplayEngine engine(queue, flat, api, connectivity, *scheduler);

    std::atomic<int> drains{0};
    engine.add_listener([&](const SyncResult&) { ++drains; });

    enqueue_enroll(queue, "c1");
    engine.start(std::chrono::hours(1), std::chrono::milliseconds(20));
    ASSERT_TRUE(engine.is_running());

    connectivity.set_online(true);
    for (int i = 0; i < 200 && drains.load() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    engine.stop();
    ASSERT_FALSE(engine.is_running());
    // Joins the worker before the engine goes away.
    scheduler.reset();

    ASSERT_EQ(drains.load(), 1);
    ASSERT_EQ(queue.size(), static_cast<size_t>(0));
    ASSERT_EQ(api.calls().size(), static_cast<size_t>(1));
}

/**
 * @brief The periodic timer drains while online.
 */
void test_replay_periodic_trigger()
{
    FlatStore flat;
    SyncQueue queue(flat);
    FakeRemoteApi api;
    ConnectivityMonitor connectivity(true);
    auto scheduler = std::make_unique<Scheduler>(1);
    ReplayEngine engine(queue, flat, api, connectivity, *scheduler);

    enqueue_enroll(queue, "c1");
    engine.start(std::chrono::milliseconds(20), std::chrono::milliseconds(20));

    for (int i = 0; i < 200 && queue.size() > 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    engine.stop();
    scheduler.reset();

    ASSERT_EQ(queue.size(), static_cast<size_t>(0));
    ASSERT_TRUE(flat.get_item(kLastSyncKey).has_value());
}

/**
 * @brief `stop()` returns only after a drain running on another thread is done.
 */
void test_replay_stop_waits_for_running_drain()
{
    Harness h;
    std::atomic<bool> entered{false};
    std::atomic<bool> release{false};
    std::atomic<bool> finished{false};
    h.engine->register_handler(action::kEnroll, [&](const SyncAction&) {
        entered = true;
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        finished = true;
        return true;
    });
    enqueue_enroll(h.queue, "c1");

    std::thread drainer([&]() { h.engine->drain(); });
    while (!entered.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    std::thread releaser([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        release = true;
    });

    h.engine->stop();
    bool finished_before_return = finished.load();
    bool syncing_after_return = h.engine->is_syncing();
    releaser.join();
    drainer.join();

    ASSERT_TRUE(finished_before_return);
    ASSERT_FALSE(syncing_after_return);
    ASSERT_EQ(h.queue.size(), static_cast<size_t>(0));
}

/**
 * @brief A handler stopping its own engine does not wait on itself.
 */
void test_replay_stop_from_handler()
{
    Harness h;
    h.engine->register_handler(action::kEnroll, [&](const SyncAction&) {
        h.engine->stop();
        return true;
    });
    enqueue_enroll(h.queue, "c1");

    SyncResult result = h.engine->drain();
    ASSERT_TRUE(result.success);
    ASSERT_FALSE(h.engine->is_syncing());
}

/**
 * @brief Response envelopes: data and errors are read, and the HTTP status
 * overrides the body's claim of success.
 */
void test_parse_api_response()
{
    ApiResponse ok = parse_api_response(200, R"({"success":true,"data":{"id":"e1"}})");
    ASSERT_TRUE(ok.success);
    ASSERT_EQ(ok.status, 200L);
    ASSERT_EQ(Json::get_string(ok.data.get(), "id"), std::string("e1"));
    ASSERT_TRUE(ok.error.empty());

    ApiResponse rejected = parse_api_response(400, R"({"success":false,"error":"Already enrolled"})");
    ASSERT_FALSE(rejected.success);
    ASSERT_EQ(rejected.error, std::string("Already enrolled"));

    ApiResponse message = parse_api_response(200, R"({"success":false,"message":"Quiz closed"})");
    ASSERT_FALSE(message.success);
    ASSERT_EQ(message.error, std::string("Quiz closed"));

    ApiResponse lying = parse_api_response(500, R"({"success":true})");
    ASSERT_FALSE(lying.success);
    ASSERT_EQ(lying.error, std::string("HTTP 500"));

    ApiResponse html = parse_api_response(502, "<html>Bad Gateway</html>");
    ASSERT_FALSE(html.success);
    ASSERT_EQ(html.error, std::string("HTTP 502"));
    ASSERT_TRUE(html.data == nullptr);

    ApiResponse garbled = parse_api_response(200, "not json");
    ASSERT_FALSE(garbled.success);
    ASSERT_EQ(garbled.error, std::string("Unreadable response body"));
}
