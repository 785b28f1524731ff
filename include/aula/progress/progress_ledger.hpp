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
 * @file progress_ledger.hpp
 * @brief Per-lesson learning progress with derived course aggregates.
 *
 * @details
 * Each entry lives at `progress_{userId}_{courseId}_{lessonId|overall}` in the
 * document store and, as a best-effort copy, under the same key in the flat
 * store. Course-level figures are never stored: they are recomputed from a
 * prefix scan on every `get_course_progress` call.
 *
 * When the document store reports itself unavailable, reads and writes are
 * served by the flat mirror alone. Callers see the same results either way.
 */

#pragma once

#include "aula/infra/json.hpp"
#include "aula/storage/document_store.hpp"
#include "aula/storage/flat_store.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace aula::progress {

inline constexpr const char* kProgressPrefix = "progress_";

/// @brief Lesson key used when an entry is not tied to a lesson.
inline constexpr const char* kOverallLesson = "overall";

struct LessonProgress {
    double percentage = 0.0;
    std::int64_t time_spent = 0; ///< Seconds.
    std::optional<double> current_position;
    bool is_completed = false;
    std::optional<std::string> completed_at;
    std::string last_updated; ///< Stamped by `save_progress`.
};

struct ProgressMetadata {
    std::optional<std::string> course_title;
    std::optional<std::string> lesson_title;
    std::optional<std::string> module_title;
    std::optional<std::string> instructor_name;
};

struct ProgressEntry {
    std::string user_id;
    std::string course_id;
    std::optional<std::string> lesson_id;
    std::optional<std::string> module_id;
    LessonProgress progress;
    ProgressMetadata metadata;

    std::string key() const;
};

/**
 * @struct CourseProgress
 * @brief Aggregate derived from every entry of one `(user, course)` pair.
 */
struct CourseProgress {
    std::string course_id;
    int total_lessons = 0;
    int completed_lessons = 0;
    std::int64_t total_time_spent = 0;
    int overall_percentage = 0; ///< `round(completed / total * 100)`.
    std::string last_activity;  ///< Latest `last_updated` across entries.
    std::map<std::string, LessonProgress> lessons;
};

struct DatabaseInfo {
    bool available = false;
    std::string database_name;
    std::string state;
    std::size_t document_count = 0;
    std::uint64_t update_seq = 0;
    std::size_t progress_documents = 0;
    bool is_fallback = false;
    std::string error; ///< Set when `available` is false.
};

infra::Json::Ptr to_json(const ProgressEntry& entry);
void from_json(const cJSON* node, ProgressEntry& out);

class ProgressLedger {
  public:
    ProgressLedger(storage::DocumentStore& store, storage::FlatStore& flat);

    /**
     * @brief `progress_{user}_{course}_{lesson}`, with `overall` for a missing lesson.
     *
     * Ids are not escaped, so the key prefix of course `c` is also a prefix of
     * course `c_x`. Scans check the ids stored in each entry.
     */
    static std::string progress_key(const std::string& user_id, const std::string& course_id,
                                    const std::optional<std::string>& lesson_id);

    /**
     * @brief Creates or replaces an entry, stamping `lastUpdated` to now.
     *
     * The mirror copy is best-effort: its failure is logged, not raised. If
     * the document store is unavailable the mirror becomes the only copy and
     * its errors propagate.
     *
     * @return The entry as stored.
     */
    ProgressEntry save_progress(const ProgressEntry& entry);

    std::optional<LessonProgress> get_progress(const std::string& user_id,
                                               const std::string& course_id,
                                               const std::optional<std::string>& lesson_id = {});

    /**
     * @brief Aggregates every entry under `progress_{user}_{course}_`.
     *
     * @return `std::nullopt` when there is no progress yet.
     */
    std::optional<CourseProgress> get_course_progress(const std::string& user_id,
                                                      const std::string& course_id);

    std::vector<ProgressEntry> get_all_user_progress(const std::string& user_id);

    /**
     * @brief Removes one entry from both representations.
     *
     * @return true once the entry is gone, including when it never existed.
     */
    bool delete_progress(const std::string& user_id, const std::string& course_id,
                         const std::optional<std::string>& lesson_id = {});

    /**
     * @brief Removes every entry of a user from both representations.
     *
     * Keeps going past individual failures.
     *
     * @return false if any single deletion failed.
     */
    bool clear_all_progress(const std::string& user_id);

    DatabaseInfo database_info();

  private:
    std::vector<ProgressEntry> scan(const std::string& prefix, const std::string& user_id,
                                    const std::optional<std::string>& course_id);
    std::vector<ProgressEntry> scan_mirror(const std::string& prefix, const std::string& user_id,
                                           const std::optional<std::string>& course_id);

    storage::DocumentStore& store_;
    storage::FlatStore& flat_;
};

/**
 * @brief Folds entries of one course into a `CourseProgress`.
 *
 * @return `std::nullopt` for an empty input.
 */
std::optional<CourseProgress> aggregate_course_progress(const std::string& course_id,
                                                        const std::vector<ProgressEntry>& entries);

} // namespace aula::progress
