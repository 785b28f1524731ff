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
 * @file entities.hpp
 * @brief Domain records cached for offline use, and their JSON mapping.
 *
 * @details
 * Field names on the wire (camelCase) match the platform API, so a payload
 * fetched online can be cached and read back without translation. Readers are
 * lenient: a field missing from an older cached payload takes its default.
 */

#pragma once

#include "aula/infra/json.hpp"

#include <optional>
#include <string>
#include <vector>

namespace aula::cache {

/**
 * @enum UserRole
 * @brief Account role on the platform.
 */
enum class UserRole { LEARNER, TUTOR, ADMIN };

const char* to_string(UserRole role);

/// @brief Unknown names map to `LEARNER`.
UserRole parse_user_role(const std::string& name);

struct User {
    std::string id;
    std::string name;
    std::string email;
    UserRole role = UserRole::LEARNER;
    std::optional<std::string> avatar;
    bool verified = false;
    std::optional<std::string> last_login;
};

struct Enrollment {
    std::string id;
    std::string enrolled_at;
    double progress = 0.0;
    std::string status;
};

/// @brief Server-computed progress snapshot carried on a course.
struct ProgressSummary {
    double overall_progress = 0.0;
    int completed_lessons = 0;
    int total_lessons = 0;
};

struct Section {
    std::string id;
    std::string title;
    std::vector<std::string> module_ids;
};

struct Course {
    std::string id;
    std::string title;
    std::string description;
    std::optional<std::string> thumbnail;
    std::string instructor_id;
    std::string instructor_name;
    int total_duration = 0; ///< Minutes.
    std::string level;
    std::string category;
    std::string status;
    std::string created_at;
    std::string updated_at;
    std::vector<std::string> learning_objectives;
    std::optional<Enrollment> enrollment;
    std::optional<ProgressSummary> progress;
    std::vector<Section> sections;
    int total_modules = 0;
    bool is_enrolled = false;
    std::string last_cached;

    /// @brief Set only by a successful `EntityCache::cache_course`.
    bool offline_accessible = false;
};

struct Module {
    std::string id;
    std::string title;
    std::string description;
    int estimated_duration = 0; ///< Minutes.
    std::string video_url;
    std::string video_provider = "youtube";
    std::optional<std::string> pdf_url;
    int order = 0;
    bool is_completed = false;
    bool is_unlocked = false;
    std::optional<std::string> next_module_id;
    bool has_quiz = false;
    std::string course_id;
};

/// @brief A downloadable file belonging to a module (lecture notes, slides).
struct Attachment {
    std::string id;
    std::string module_id;
    std::string course_id;
    std::string file_name;
    std::string mime_type;
    std::string url;
    std::int64_t size_bytes = 0;
    std::optional<std::string> local_path; ///< Set once the file is downloaded.
};

infra::Json::Ptr to_json(const User& user);
infra::Json::Ptr to_json(const Course& course);
infra::Json::Ptr to_json(const Module& module);
infra::Json::Ptr to_json(const Attachment& attachment);

void from_json(const cJSON* node, User& out);
void from_json(const cJSON* node, Course& out);
void from_json(const cJSON* node, Module& out);
void from_json(const cJSON* node, Attachment& out);

} // namespace aula::cache
