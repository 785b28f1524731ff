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
 * @file entities.cpp
 * @brief JSON mapping of cached entities.
 */

#include "aula/cache/entities.hpp"

#include "aula/infra/string.hpp"

namespace aula::cache {

using infra::Json;

const char* to_string(UserRole role)
{
    switch (role) {
    case UserRole::LEARNER:
        return "learner";
    case UserRole::TUTOR:
        return "tutor";
    case UserRole::ADMIN:
        return "admin";
    }
    return "learner";
}

UserRole parse_user_role(const std::string& name)
{
    std::string lowered = infra::String::to_lower(name);
    if (lowered == "tutor")
        return UserRole::TUTOR;
    if (lowered == "admin")
        return UserRole::ADMIN;
    return UserRole::LEARNER;
}

namespace {

void set_optional(cJSON* obj, const char* field, const std::optional<std::string>& value)
{
    if (value) {
        Json::set_string(obj, field, *value);
    } else {
        Json::set_null(obj, field);
    }
}

} // namespace

// --- User --------------------------------------------------------------------

Json::Ptr to_json(const User& user)
{
    Json::Ptr obj = Json::object();
    Json::set_string(obj.get(), "id", user.id);
    Json::set_string(obj.get(), "name", user.name);
    Json::set_string(obj.get(), "email", user.email);
    Json::set_string(obj.get(), "role", to_string(user.role));
    set_optional(obj.get(), "avatar", user.avatar);
    Json::set_bool(obj.get(), "verified", user.verified);
    if (user.last_login) {
        Json::set_string(obj.get(), "lastLogin", *user.last_login);
    }
    return obj;
}

void from_json(const cJSON* node, User& out)
{
    out.id = Json::get_string(node, "id");
    out.name = Json::get_string(node, "name");
    out.email = Json::get_string(node, "email");
    out.role = parse_user_role(Json::get_string(node, "role", "learner"));
    out.avatar = Json::get_optional_string(node, "avatar");
    out.verified = Json::get_bool(node, "verified");
    out.last_login = Json::get_optional_string(node, "lastLogin");
}

// --- Course ------------------------------------------------------------------

Json::Ptr to_json(const Course& course)
{
    Json::Ptr obj = Json::object();
    cJSON* o = obj.get();
    Json::set_string(o, "id", course.id);
    Json::set_string(o, "title", course.title);
    Json::set_string(o, "description", course.description);
    set_optional(o, "thumbnail", course.thumbnail);
    Json::set_string(o, "instructorId", course.instructor_id);
    Json::set_string(o, "instructorName", course.instructor_name);
    Json::set_number(o, "totalDuration", course.total_duration);
    Json::set_string(o, "level", course.level);
    Json::set_string(o, "category", course.category);
    Json::set_string(o, "status", course.status);
    Json::set_string(o, "createdAt", course.created_at);
    Json::set_string(o, "updatedAt", course.updated_at);
    Json::set_string_array(o, "learningObjectives", course.learning_objectives);

    if (course.enrollment) {
        Json::Ptr enrollment = Json::object();
        Json::set_string(enrollment.get(), "id", course.enrollment->id);
        Json::set_string(enrollment.get(), "enrolledAt", course.enrollment->enrolled_at);
        Json::set_number(enrollment.get(), "progress", course.enrollment->progress);
        Json::set_string(enrollment.get(), "status", course.enrollment->status);
        Json::set_item(o, "enrollment", std::move(enrollment));
    } else {
        Json::set_null(o, "enrollment");
    }

    if (course.progress) {
        Json::Ptr progress = Json::object();
        Json::set_number(progress.get(), "overallProgress", course.progress->overall_progress);
        Json::set_number(progress.get(), "completedLessons", course.progress->completed_lessons);
        Json::set_number(progress.get(), "totalLessons", course.progress->total_lessons);
        Json::set_item(o, "progress", std::move(progress));
    } else {
        Json::set_null(o, "progress");
    }

    Json::Ptr sections = Json::array();
    for (const auto& section : course.sections) {
        Json::Ptr s = Json::object();
        Json::set_string(s.get(), "id", section.id);
        Json::set_string(s.get(), "title", section.title);
        Json::set_string_array(s.get(), "moduleIds", section.module_ids);
        Json::append(sections.get(), std::move(s));
    }
    Json::set_item(o, "sections", std::move(sections));

    Json::set_number(o, "totalModules", course.total_modules);
    Json::set_bool(o, "isEnrolled", course.is_enrolled);
    Json::set_string(o, "lastCached", course.last_cached);
    Json::set_bool(o, "offlineAccessible", course.offline_accessible);
    return obj;
}

void from_json(const cJSON* node, Course& out)
{
    // Server payloads carry `_id`; cached payloads carry `id`.
    out.id = Json::get_string(node, "id", Json::get_string(node, "_id"));
    out.title = Json::get_string(node, "title");
    out.description = Json::get_string(node, "description");
    out.thumbnail = Json::get_optional_string(node, "thumbnail");
    out.instructor_id = Json::get_string(node, "instructorId");
    out.instructor_name = Json::get_string(node, "instructorName");
    out.total_duration = static_cast<int>(Json::get_int(node, "totalDuration"));
    out.level = Json::get_string(node, "level");
    out.category = Json::get_string(node, "category");
    out.status = Json::get_string(node, "status");
    out.created_at = Json::get_string(node, "createdAt");
    out.updated_at = Json::get_string(node, "updatedAt");
    out.learning_objectives = Json::get_string_array(node, "learningObjectives");

    out.enrollment.reset();
    if (const cJSON* e = Json::child(node, "enrollment"); cJSON_IsObject(e)) {
        Enrollment enrollment;
        enrollment.id = Json::get_string(e, "id");
        enrollment.enrolled_at = Json::get_string(e, "enrolledAt");
        enrollment.progress = Json::get_number(e, "progress");
        enrollment.status = Json::get_string(e, "status");
        out.enrollment = enrollment;
    }

    out.progress.reset();
    if (const cJSON* p = Json::child(node, "progress"); cJSON_IsObject(p)) {
        ProgressSummary summary;
        // Older payloads use `percentage` instead of `overallProgress`.
        summary.overall_progress =
            Json::get_number(p, "overallProgress", Json::get_number(p, "percentage"));
        summary.completed_lessons = static_cast<int>(Json::get_int(p, "completedLessons"));
        summary.total_lessons = static_cast<int>(Json::get_int(p, "totalLessons"));
        out.progress = summary;
    }

    out.sections.clear();
    if (const cJSON* arr = Json::child(node, "sections"); cJSON_IsArray(arr)) {
        const cJSON* item = nullptr;
        cJSON_ArrayForEach(item, arr)
        {
            Section section;
            section.id = Json::get_string(item, "id", Json::get_string(item, "_id"));
            section.title = Json::get_string(item, "title");
            section.module_ids = Json::get_string_array(item, "moduleIds");
            out.sections.push_back(std::move(section));
        }
    }

    out.total_modules = static_cast<int>(Json::get_int(node, "totalModules"));
    out.is_enrolled = Json::get_bool(node, "isEnrolled");
    out.last_cached = Json::get_string(node, "lastCached");
    out.offline_accessible = Json::get_bool(node, "offlineAccessible");
}

// --- Module ------------------------------------------------------------------

Json::Ptr to_json(const Module& module)
{
    Json::Ptr obj = Json::object();
    cJSON* o = obj.get();
    Json::set_string(o, "id", module.id);
    Json::set_string(o, "title", module.title);
    Json::set_string(o, "description", module.description);
    Json::set_number(o, "estimatedDuration", module.estimated_duration);
    Json::set_string(o, "videoUrl", module.video_url);
    Json::set_string(o, "videoProvider", module.video_provider);
    set_optional(o, "pdfUrl", module.pdf_url);
    Json::set_number(o, "order", module.order);
    Json::set_bool(o, "isCompleted", module.is_completed);
    Json::set_bool(o, "isUnlocked", module.is_unlocked);
    set_optional(o, "nextModuleId", module.next_module_id);
    Json::set_bool(o, "hasQuiz", module.has_quiz);
    Json::set_string(o, "courseId", module.course_id);
    return obj;
}

void from_json(const cJSON* node, Module& out)
{
    out.id = Json::get_string(node, "id", Json::get_string(node, "_id"));
    out.title = Json::get_string(node, "title");
    out.description = Json::get_string(node, "description");
    out.estimated_duration = static_cast<int>(Json::get_int(node, "estimatedDuration"));
    out.video_url = Json::get_string(node, "videoUrl");
    out.video_provider = Json::get_string(node, "videoProvider", "youtube");
    out.pdf_url = Json::get_optional_string(node, "pdfUrl");
    out.order = static_cast<int>(Json::get_int(node, "order"));
    out.is_completed = Json::get_bool(node, "isCompleted");
    out.is_unlocked = Json::get_bool(node, "isUnlocked");
    out.next_module_id = Json::get_optional_string(node, "nextModuleId");
    out.has_quiz = Json::get_bool(node, "hasQuiz");
    out.course_id = Json::get_string(node, "courseId");
}

// --- Attachment --------------------------------------------------------------

Json::Ptr to_json(const Attachment& attachment)
{
    Json::Ptr obj = Json::object();
    cJSON* o = obj.get();
    Json::set_string(o, "id", attachment.id);
    Json::set_string(o, "moduleId", attachment.module_id);
    Json::set_string(o, "courseId", attachment.course_id);
    Json::set_string(o, "fileName", attachment.file_name);
    Json::set_string(o, "mimeType", attachment.mime_type);
    Json::set_string(o, "url", attachment.url);
    Json::set_number(o, "sizeBytes", static_cast<double>(attachment.size_bytes));
    set_optional(o, "localPath", attachment.local_path);
    return obj;
}

void from_json(const cJSON* node, Attachment& out)
{
    out.id = Json::get_string(node, "id");
    out.module_id = Json::get_string(node, "moduleId");
    out.course_id = Json::get_string(node, "courseId");
    out.file_name = Json::get_string(node, "fileName");
    out.mime_type = Json::get_string(node, "mimeType");
    out.url = Json::get_string(node, "url");
    out.size_bytes = Json::get_int(node, "sizeBytes");
    out.local_path = Json::get_optional_string(node, "localPath");
}

} // namespace aula::cache
