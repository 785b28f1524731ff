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
 * @file main_test.cpp
 * @brief Entry point of the Aula offline core test suite.
 *
 * @details
 * Aggregates the unit and integration tests of every subsystem and runs them
 * sequentially. Tests that persist data use their own scratch directories
 * under the working directory.
 */

#include "framework.hpp"

#include <iostream>

// ============================================================================
// Forward Declarations
// ============================================================================

// Infrastructure (infra_test.cpp)
void test_uuid_length();
void test_uuid_uniqueness();
void test_random_hex();
void test_string_trim();
void test_string_trim_empty();
void test_string_iequals();
void test_clock_iso8601();
void test_json_accessors();
void test_log_level_parse();
void test_scheduler_delayed_and_cancel();
void test_scheduler_periodic();

// Configuration (config_test.cpp)
void test_config_missing_file_defaults();
void test_config_file_overrides();
void test_config_rejects_bad_input();
void test_config_env_overrides();

// Document Store (storage_test.cpp)
void test_log_engine_persistence();
void test_log_engine_conflicts();
void test_log_engine_torn_tail();
void test_log_engine_corrupt_frame();
void test_log_engine_quota();
void test_log_engine_compaction();
void test_fallback_parity();
void test_memory_engine_capacity();
void test_store_retries_then_fallback();
void test_store_recovers_on_retry();
void test_store_unavailable();
void test_store_upsert_sequential();
void test_flat_store_persistence();
void test_flat_store_quota();
void test_flat_store_write_failure();
void test_prefix_range_multibyte_keys();
void test_log_engine_destroy_failure_keeps_index();

// Entity Cache (cache_test.cpp)
void test_cache_course_idempotent();
void test_cache_course_defaults();
void test_get_cached_course_absent();
void test_sequential_updates_no_conflict();
void test_user_shadow_fallback();
void test_enrolled_courses();
void test_modules_and_attachments_by_parent();
void test_learner_cache_status_and_stats();
void test_cleanup_old_cache_data();

// Progress Ledger (progress_test.cpp)
void test_progress_key_layout();
void test_course_progress_aggregate();
void test_save_progress_stamps();
void test_save_progress_requires_ids();
void test_progress_mirror_fallback();
void test_progress_total_loss();
void test_delete_and_clear_progress();
void test_end_to_end_durability_boundary();
void test_course_progress_multibyte_lesson_ids();
void test_progress_ids_sharing_a_key_prefix();
void test_clear_progress_reports_mirror_failure();

// Offline Status (offline_test.cpp)
void test_connectivity_transitions();
void test_offline_auth_matches_email();
void test_offline_auth_restores_shadow();
void test_offline_auth_rewrites_whole_shadow();
void test_offline_auth_without_store();
void test_validate_offline_data();
void test_validate_without_store();
void test_essential_status();
void test_cache_version_fresh_and_current();
void test_cache_version_migration();
void test_cache_version_purge();
void test_cache_version_chain();

// Sync (sync_test.cpp)
void test_sync_queue_order_and_ids();
void test_sync_queue_remove_preserves_new_items();
void test_sync_queue_survives_garbage();
void test_replay_per_action_commit();
void test_replay_clear_on_any_success();
void test_replay_nothing_accepted();
void test_replay_default_handlers();
void test_replay_unknown_type();
void test_replay_network_error();
void test_replay_refused_offline();
void test_replay_in_flight_guard();
void test_replay_keeps_items_enqueued_during_drain();
void test_replay_listeners_and_stats();
void test_replay_reconnect_trigger();
void test_replay_periodic_trigger();
void test_replay_stop_waits_for_running_drain();
void test_replay_stop_from_handler();
void test_parse_api_response();

// Offline Client (client_test.cpp)
void test_client_init_ready();
void test_client_refuses_before_init();
void test_client_init_unavailable();
void test_client_complete_module();
void test_client_enroll_and_sync();
void test_client_queues_learner_actions();
void test_client_logout_clear();
void test_client_surfaces_quota_on_cache_write();

/**
 * @brief Runs every registered test.
 *
 * @return 0 when all tests passed, 1 otherwise.
 */
int main()
{
    std::cout << "\033[36mRunning Aula Offline Core Test Suite...\033[0m" << std::endl;

    // --- 1. Infrastructure ---
    // Identifiers, strings, clock, JSON helpers and the scheduler.
    RUN_TEST(test_uuid_length);
    RUN_TEST(test_uuid_uniqueness);
    RUN_TEST(test_random_hex);
    RUN_TEST(test_string_trim);
    RUN_TEST(test_string_trim_empty);
    RUN_TEST(test_string_iequals);
    RUN_TEST(test_clock_iso8601);
    RUN_TEST(test_json_accessors);
    RUN_TEST(test_log_level_parse);
    RUN_TEST(test_scheduler_delayed_and_cancel);
    RUN_TEST(test_scheduler_periodic);

    // --- 2. Configuration ---
    // Defaults, file overrides and environment overrides.
    RUN_TEST(test_config_missing_file_defaults);
    RUN_TEST(test_config_file_overrides);
    RUN_TEST(test_config_rejects_bad_input);
    RUN_TEST(test_config_env_overrides);

    // --- 3. Document Store ---
    // Log engine durability, fallback parity, retry policy and the flat store.
    RUN_TEST(test_log_engine_persistence);
    RUN_TEST(test_log_engine_conflicts);
    RUN_TEST(test_log_engine_torn_tail);
    RUN_TEST(test_log_engine_corrupt_frame);
    RUN_TEST(test_log_engine_quota);
    RUN_TEST(test_log_engine_compaction);
    RUN_TEST(test_fallback_parity);
    RUN_TEST(test_memory_engine_capacity);
    RUN_TEST(test_store_retries_then_fallback);
    RUN_TEST(test_store_recovers_on_retry);
    RUN_TEST(test_store_unavailable);
    RUN_TEST(test_store_upsert_sequential);
    RUN_TEST(test_flat_store_persistence);
    RUN_TEST(test_flat_store_quota);
    RUN_TEST(test_flat_store_write_failure);
    RUN_TEST(test_prefix_range_multibyte_keys);
    RUN_TEST(test_log_engine_destroy_failure_keeps_index);

    // --- 4. Entity Cache ---
    // Course, user, module and attachment caching plus learner maintenance.
    RUN_TEST(test_cache_course_idempotent);
    RUN_TEST(test_cache_course_defaults);
    RUN_TEST(test_get_cached_course_absent);
    RUN_TEST(test_sequential_updates_no_conflict);
    RUN_TEST(test_user_shadow_fallback);
    RUN_TEST(test_enrolled_courses);
    RUN_TEST(test_modules_and_attachments_by_parent);
    RUN_TEST(test_learner_cache_status_and_stats);
    RUN_TEST(test_cleanup_old_cache_data);

    // --- 5. Progress Ledger ---
    // Progress documents, aggregates and the flat mirror.
    RUN_TEST(test_progress_key_layout);
    RUN_TEST(test_course_progress_aggregate);
    RUN_TEST(test_save_progress_stamps);
    RUN_TEST(test_save_progress_requires_ids);
    RUN_TEST(test_progress_mirror_fallback);
    RUN_TEST(test_progress_total_loss);
    RUN_TEST(test_delete_and_clear_progress);
    RUN_TEST(test_end_to_end_durability_boundary);
    RUN_TEST(test_course_progress_multibyte_lesson_ids);
    RUN_TEST(test_progress_ids_sharing_a_key_prefix);
    RUN_TEST(test_clear_progress_reports_mirror_failure);

    // --- 6. Offline Status ---
    // Connectivity, offline login, validation and cache versioning.
    RUN_TEST(test_connectivity_transitions);
    RUN_TEST(test_offline_auth_matches_email);
    RUN_TEST(test_offline_auth_restores_shadow);
    RUN_TEST(test_offline_auth_rewrites_whole_shadow);
    RUN_TEST(test_offline_auth_without_store);
    RUN_TEST(test_validate_offline_data);
    RUN_TEST(test_validate_without_store);
    RUN_TEST(test_essential_status);
    RUN_TEST(test_cache_version_fresh_and_current);
    RUN_TEST(test_cache_version_migration);
    RUN_TEST(test_cache_version_purge);
    RUN_TEST(test_cache_version_chain);

    // --- 7. Sync ---
    // Sync queue and replay engine.
    RUN_TEST(test_sync_queue_order_and_ids);
    RUN_TEST(test_sync_queue_remove_preserves_new_items);
    RUN_TEST(test_sync_queue_survives_garbage);
    RUN_TEST(test_replay_per_action_commit);
    RUN_TEST(test_replay_clear_on_any_success);
    RUN_TEST(test_replay_nothing_accepted);
    RUN_TEST(test_replay_default_handlers);
    RUN_TEST(test_replay_unknown_type);
    RUN_TEST(test_replay_network_error);
    RUN_TEST(test_replay_refused_offline);
    RUN_TEST(test_replay_in_flight_guard);
    RUN_TEST(test_replay_keeps_items_enqueued_during_drain);
    RUN_TEST(test_replay_listeners_and_stats);
    RUN_TEST(test_replay_reconnect_trigger);
    RUN_TEST(test_replay_periodic_trigger);
    RUN_TEST(test_replay_stop_waits_for_running_drain);
    RUN_TEST(test_replay_stop_from_handler);
    RUN_TEST(test_parse_api_response);

    // --- 8. Offline Client ---
    // The facade driven end to end.
    RUN_TEST(test_client_init_ready);
    RUN_TEST(test_client_refuses_before_init);
    RUN_TEST(test_client_init_unavailable);
    RUN_TEST(test_client_complete_module);
    RUN_TEST(test_client_enroll_and_sync);
    RUN_TEST(test_client_queues_learner_actions);
    RUN_TEST(test_client_logout_clear);
    RUN_TEST(test_client_surfaces_quota_on_cache_write);

    aula::test::print_summary();

    return (aula::test::failed_count == 0) ? 0 : 1;
}
