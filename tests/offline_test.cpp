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
 * @file offline_test.cpp
 * @brief Unit tests for connectivity, offline login, validation and cache versioning.
 */

#include "aula/cache/entity_cache.hpp"
#include "aula/cache/learner_cache.hpp"
#include "aula/offline/cache_version.hpp"
#include "aula/offline/connectivity.hpp"
#include "aula/offline/offline_auth.hpp"
#include "aula/offline/offline_validator.hpp"
#include "aula/sync/sync_queue.hpp"
#include "framework.hpp"
#include "test_support.hpp"

#include <string>
#include <vector>

using namespace aula::offline;
using aula::cache::Course;
using aula::cache::EntityCache;
using aula::cache::User;
using aula::cache::UserRole;
using aula::storage::FlatStore;

namespace {

User ada()
{
    return User{"u1", "Ada", "a@x.com", UserRole::LEARNER, std::nullopt, true, std::nullopt};
}

Course course(const std::string& id)
{
    Course c;
    c.id = id;
    c.title = "Course " + id;
    return c;
}

} // namespace

/**
 * @brief Listeners fire on transitions only.
 */
void test_connectivity_transitions()
{
    ConnectivityMonitor monitor(true);
    std::vector<bool> seen;
    auto id = monitor.subscribe([&](bool online) { seen.push_back(online); });

    monitor.set_online(true);
    monitor.set_online(false);
    monitor.set_online(false);
    monitor.set_online(true);

    ASSERT_EQ(seen.size(), static_cast<size_t>(2));
    ASSERT_FALSE(seen[0]);
    ASSERT_TRUE(seen[1]);

    ASSERT_TRUE(monitor.unsubscribe(id));
    ASSERT_FALSE(monitor.unsubscribe(id));
    monitor.set_online(false);
    ASSERT_EQ(seen.size(), static_cast<size_t>(2));
    ASSERT_FALSE(monitor.is_online());
}

/**
 * @brief Email match is case-insensitive and the password is not consulted.
 */
void test_offline_auth_matches_email()
{
    auto store = aula::test::memory_store();
    FlatStore flat;
    EntityCache cache(*store, flat);
    OfflineAuthenticator auth(cache, flat);

    cache.cache_user(ada());

    AuthResult ok = auth.authenticate_offline("A@x.com", "anything");
    ASSERT_TRUE(ok.success);
    ASSERT_EQ(ok.user->id, std::string("u1"));
    ASSERT_EQ(ok.message, std::string("Offline login successful"));
    ASSERT_TRUE(auth.last_offline_login().has_value());

    AuthResult miss = auth.authenticate_offline("b@x.com", "anything");
    ASSERT_FALSE(miss.success);
    ASSERT_FALSE(miss.user.has_value());
    ASSERT_EQ(miss.message,
              std::string("No cached user found. Please login online first to enable offline access."));

    ASSERT_FALSE(auth.authenticate_offline("   ", "x").success);
}

/**
 * @brief A cached user whose shadow was cleared is still found, and the
 * shadow is restored.
 */
void test_offline_auth_restores_shadow()
{
    auto store = aula::test::memory_store();
    FlatStore flat;
    EntityCache cache(*store, flat);
    OfflineAuthenticator auth(cache, flat);

    cache.cache_user(ada());
    cache.cache_user(User{"u2", "Bob", "bob@x.com", UserRole::LEARNER, std::nullopt, false,
                          std::nullopt});
    // The shadow now points at Bob; Ada is only in the document store.
    AuthResult result = auth.authenticate_offline("A@X.COM", "");
    ASSERT_TRUE(result.success);
    ASSERT_EQ(flat.get_item(aula::cache::shadow::kUserId).value_or(""), std::string("u1"));
    ASSERT_EQ(flat.get_item(aula::cache::shadow::kEmail).value_or(""), std::string("a@x.com"));
}

/**
 * @brief A restored shadow carries no field left over from the previous identity.
 */
void test_offline_auth_rewrites_whole_shadow()
{
    auto store = aula::test::memory_store();
    FlatStore flat;
    EntityCache cache(*store, flat);
    OfflineAuthenticator auth(cache, flat);

    User first = ada();
    first.avatar = std::nullopt;
    first.verified = true;
    cache.cache_user(first);
    cache.cache_user(User{"u2", "Bob", "bob@x.com", UserRole::TUTOR, std::string("b.png"),
                          false, std::nullopt});

    ASSERT_TRUE(auth.authenticate_offline("a@x.com", "").success);
    std::optional<User> shadow = cache.shadow_user();
    ASSERT_TRUE(shadow.has_value());
    ASSERT_EQ(shadow->id, std::string("u1"));
    ASSERT_FALSE(shadow->avatar.has_value());
    ASSERT_TRUE(shadow->verified);
    ASSERT_TRUE(shadow->role == first.role);
}

/**
 * @brief Offline login survives an unavailable store through the shadow.
 */
void test_offline_auth_without_store()
{
    FlatStore flat;
    {
        auto store = aula::test::memory_store();
        EntityCache cache(*store, flat);
        cache.cache_user(ada());
    }

    auto dead = aula::test::unavailable_store();
    EntityCache cache(*dead, flat);
    OfflineAuthenticator auth(cache, flat);

    ASSERT_TRUE(auth.authenticate_offline("a@x.com", "").success);
    ASSERT_FALSE(auth.authenticate_offline("z@x.com", "").success);
}

void test_validate_offline_data()
{
    auto store = aula::test::memory_store();
    FlatStore flat;
    EntityCache cache(*store, flat);
    ConnectivityMonitor monitor(false);
    OfflineValidator validator(cache, flat, monitor);

    ValidationReport empty = validator.validate_offline_data();
    ASSERT_FALSE(empty.is_valid);
    ASSERT_FALSE(empty.can_proceed);
    ASSERT_EQ(empty.issues.size(), static_cast<size_t>(2));
    ASSERT_EQ(empty.issues[0], std::string("No cached user found"));

    cache.cache_course(course("c1"));
    ValidationReport courses_only = validator.validate_offline_data();
    ASSERT_FALSE(courses_only.is_valid);
    ASSERT_TRUE(courses_only.can_proceed);

    cache.cache_user(ada());
    ValidationReport full = validator.validate_offline_data();
    ASSERT_TRUE(full.is_valid);
    ASSERT_TRUE(full.issues.empty());
    ASSERT_TRUE(full.can_proceed);
}

void test_validate_without_store()
{
    auto dead = aula::test::unavailable_store();
    FlatStore flat;
    EntityCache cache(*dead, flat);
    ConnectivityMonitor monitor(false);
    OfflineValidator validator(cache, flat, monitor);

    ValidationReport report = validator.validate_offline_data();
    ASSERT_FALSE(report.is_valid);
    ASSERT_FALSE(report.can_proceed);
    ASSERT_EQ(report.issues[0], std::string("No cached user found"));
    ASSERT_EQ(report.issues[1], std::string("Local database not available"));

    EssentialStatus status = validator.essential_status();
    ASSERT_TRUE(status.is_offline);
    ASSERT_EQ(status.database_status, std::string("failed"));
    ASSERT_FALSE(status.can_access_courses);
}

void test_essential_status()
{
    auto store = aula::test::memory_store();
    FlatStore flat;
    EntityCache cache(*store, flat);
    ConnectivityMonitor monitor(true);
    OfflineValidator validator(cache, flat, monitor);

    cache.cache_user(ada());
    cache.cache_course(course("c1"));
    flat.set_item(aula::sync::kLastSyncKey, "2026-03-01T00:00:00.000Z");

    EssentialStatus online = validator.essential_status();
    ASSERT_FALSE(online.is_offline);
    ASSERT_FALSE(online.can_access_courses);
    ASSERT_EQ(online.last_sync.value_or(""), std::string("2026-03-01T00:00:00.000Z"));

    monitor.set_online(false);
    EssentialStatus offline = validator.essential_status();
    ASSERT_TRUE(offline.has_local_data);
    ASSERT_TRUE(offline.has_cached_courses);
    ASSERT_TRUE(offline.can_access_courses);
    ASSERT_EQ(offline.database_status, std::string("ready"));
}

void test_cache_version_fresh_and_current()
{
    auto store = aula::test::memory_store();
    FlatStore flat;
    EntityCache cache(*store, flat);

    CacheVersionManager first(cache, flat);
    ASSERT_FALSE(first.is_ready());
    ASSERT_TRUE(first.initialize() == VersionOutcome::FRESH);
    ASSERT_TRUE(first.is_ready());
    ASSERT_EQ(first.stored_version().value_or(""), std::string(kCurrentCacheVersion));

    CacheVersionManager second(cache, flat);
    ASSERT_TRUE(second.initialize() == VersionOutcome::CURRENT);
}

/**
 * @brief The built-in 0.9.0 step marks existing courses offline-accessible.
 */
void test_cache_version_migration()
{
    auto store = aula::test::memory_store();
    FlatStore flat;
    EntityCache cache(*store, flat);

    Course legacy = course("c1");
    legacy.offline_accessible = false;
    cache.update_cached_course(legacy);
    flat.set_item(aula::cache::kCacheVersionKey, "0.9.0");

    CacheVersionManager versions(cache, flat);
    ASSERT_TRUE(versions.initialize() == VersionOutcome::MIGRATED);
    ASSERT_TRUE(cache.get_cached_course("c1")->offline_accessible);
    ASSERT_EQ(versions.stored_version().value_or(""), std::string("1.0.0"));
}

/**
 * @brief An unknown prior version purges entity caches and keeps progress.
 */
void test_cache_version_purge()
{
    auto store = aula::test::memory_store();
    FlatStore flat;
    EntityCache cache(*store, flat);

    cache.cache_user(ada());
    cache.cache_course(course("c1"));
    store->put(aula::storage::Document{"progress_u1_c1_overall", std::nullopt, "{}"});
    flat.set_item(aula::cache::kCacheVersionKey, "0.1.0");

    CacheVersionManager versions(cache, flat);
    ASSERT_TRUE(versions.initialize() == VersionOutcome::PURGED);
    ASSERT_EQ(cache.get_all_cached_courses().size(), static_cast<size_t>(0));
    ASSERT_EQ(cache.get_all_cached_users().size(), static_cast<size_t>(0));
    ASSERT_TRUE(store->get("progress_u1_c1_overall").has_value());
    ASSERT_EQ(versions.stored_version().value_or(""), std::string("1.0.0"));
}

/**
 * @brief Registered steps chain until the current version is reached.
 */
void test_cache_version_chain()
{
    auto store = aula::test::memory_store();
    FlatStore flat;
    EntityCache cache(*store, flat);
    flat.set_item(aula::cache::kCacheVersionKey, "1.0.0");

    std::vector<std::string> steps;
    CacheVersionManager versions(cache, flat, "1.2.0");
    versions.register_migration("1.0.0", "1.1.0",
                                [&](EntityCache&) { steps.push_back("1.0.0->1.1.0"); });
    versions.register_migration("1.1.0", "1.2.0",
                                [&](EntityCache&) { steps.push_back("1.1.0->1.2.0"); });

    ASSERT_TRUE(versions.initialize() == VersionOutcome::MIGRATED);
    ASSERT_EQ(steps.size(), static_cast<size_t>(2));
    ASSERT_EQ(steps[1], std::string("1.1.0->1.2.0"));
}
