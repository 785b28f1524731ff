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
 * @file progress_ledger.cpp
 * @brief Implementation of the progress ledger.
 */

#include "aula/progress/progress_ledger.hpp"

#include "aula/infra/clock.hpp"
#include "aula/infra/logger.hpp"
#include "aula/storage/errors.hpp"

#include <cmath>

namespace aula::progress {

using infra::Json;
using infra::LogLevel;
using infra::Logger;
using storage::StoreError;

namespace {

void set_optional(cJSON* obj, const char* field, const std::optional<std::string>& value)
{
    if (value) {
        Json::set_string(obj, field, *value);
    }
}

bool owned_by(const ProgressEntry& entry, const std::string& user_id,
              const std::optional<std::string>& course_id)
{
    return entry.user_id == user_id && (!course_id || entry.course_id == *course_id);
}

/// @brief Unreadable payloads, and payloads without a user id, count as the user's.
bool stored_for_user(const cJSON* payload, const std::string& user_id)
{
    if (!cJSON_IsObject(payload)) {
        return true;
    }
    std::string stored = Json::get_string(payload, "userId");
    return stored.empty() || stored == user_id;
}

} // namespace

std::string ProgressEntry::key() const
{
    return ProgressLedger::progress_key(user_id, course_id, lesson_id);
}

Json::Ptr to_json(const ProgressEntry& entry)
{
    Json::Ptr obj = Json::object();
    Json::set_string(obj.get(), "userId", entry.user_id);
    Json::set_string(obj.get(), "courseId", entry.course_id);
    set_optional(obj.get(), "lessonId", entry.lesson_id);
    set_optional(obj.get(), "moduleId", entry.module_id);

    Json::Ptr progress = Json::object();
    cJSON* p = progress.get();
    Json::set_number(p, "percentage", entry.progress.percentage);
    Json::set_number(p, "timeSpent", static_cast<double>(entry.progress.time_spent));
    if (entry.progress.current_position) {
        Json::set_number(p, "currentPosition", *entry.progress.current_position);
    }
    Json::set_bool(p, "isCompleted", entry.progress.is_completed);
    set_optional(p, "completedAt", entry.progress.completed_at);
    Json::set_string(p, "lastUpdated", entry.progress.last_updated);
    Json::set_item(obj.get(), "progress", std::move(progress));

    Json::Ptr metadata = Json::object();
    set_optional(metadata.get(), "courseTitle", entry.metadata.course_title);
    set_optional(metadata.get(), "lessonTitle", entry.metadata.lesson_title);
    set_optional(metadata.get(), "moduleTitle", entry.metadata.module_title);
    set_optional(metadata.get(), "instructorName", entry.metadata.instructor_name);
    Json::set_item(obj.get(), "metadata", std::move(metadata));
    return obj;
}

void from_json(const cJSON* node, ProgressEntry& out)
{
    out.user_id = Json::get_string(node, "userId");
    out.course_id = Json::get_string(node, "courseId");
    out.lesson_id = Json::get_optional_string(node, "lessonId");
    out.module_id = Json::get_optional_string(node, "moduleId");

    const cJSON* p = Json::child(node, "progress");
    out.progress = LessonProgress{};
    out.progress.percentage = Json::get_number(p, "percentage");
    out.progress.time_spent = Json::get_int(p, "timeSpent");
    if (Json::has(p, "currentPosition")) {
        out.progress.current_position = Json::get_number(p, "currentPosition");
    }
    out.progress.is_completed = Json::get_bool(p, "isCompleted");
    out.progress.completed_at = Json::get_optional_string(p, "completedAt");
    out.progress.last_updated = Json::get_string(p, "lastUpdated");

    const cJSON* m = Json::child(node, "metadata");
    out.metadata.course_title = Json::get_optional_string(m, "courseTitle");
    out.metadata.lesson_title = Json::get_optional_string(m, "lessonTitle");
    out.metadata.module_title = Json::get_optional_string(m, "moduleTitle");
    out.metadata.instructor_name = Json::get_optional_string(m, "instructorName");
}

std::optional<CourseProgress> aggregate_course_progress(const std::string& course_id,
                                                        const std::vector<ProgressEntry>& entries)
{
    if (entries.empty()) {
        return std::nullopt;
    }

    CourseProgress result;
    result.course_id = course_id;

    for (const auto& entry : entries) {
        result.lessons[entry.lesson_id.value_or(kOverallLesson)] = entry.progress;
    }

    for (const auto& [lesson, progress] : result.lessons) {
        result.total_time_spent += progress.time_spent;
        if (progress.is_completed) {
            ++result.completed_lessons;
        }
        // ISO-8601 UTC strings order chronologically.
        if (progress.last_updated > result.last_activity) {
            result.last_activity = progress.last_updated;
        }
    }

    result.total_lessons = static_cast<int>(result.lessons.size());
    result.overall_percentage = static_cast<int>(std::lround(
        static_cast<double>(result.completed_lessons) / result.total_lessons * 100.0));
    return result;
}

ProgressLedger::ProgressLedger(storage::DocumentStore& store, storage::FlatStore& flat)
    : store_(store), flat_(flat)
{
}

std::string ProgressLedger::progress_key(const std::string& user_id, const std::string& course_id,
                                         const std::optional<std::string>& lesson_id)
{
    return std::string(kProgressPrefix) + user_id + "_" + course_id + "_" +
           lesson_id.value_or(kOverallLesson);
}

ProgressEntry ProgressLedger::save_progress(const ProgressEntry& entry)
{
    if (entry.user_id.empty() || entry.course_id.empty()) {
        throw StoreError(storage::ErrorCode::INVALID_ARGUMENT,
                         "Progress requires a user id and a course id");
    }

    ProgressEntry stamped = entry;
    std::string now = infra::Clock::now_iso8601();
    stamped.progress.last_updated = now;
    if (stamped.progress.is_completed && !stamped.progress.completed_at) {
        stamped.progress.completed_at = now;
    }

    const std::string key = stamped.key();
    Json::Ptr payload = to_json(stamped);
    std::string payload_text = Json::print(payload.get());

    try {
        store_.upsert(key, [&](const std::optional<storage::Document>& current) {
            std::string cached_at = now;
            if (current) {
                Json::Ptr previous = Json::parse(current->body);
                cached_at = Json::get_string(previous.get(), "cachedAt", now);
            }
            Json::Ptr envelope = Json::object();
            Json::set_string(envelope.get(), "type", "progress");
            Json::set_string(envelope.get(), "entityId", key);
            Json::set_item(envelope.get(), "payload", Json::clone(payload.get()));
            Json::set_string(envelope.get(), "cachedAt", cached_at);
            Json::set_string(envelope.get(), "lastUpdated", now);
            return Json::print(envelope.get());
        });
    } catch (const StoreError& e) {
        if (!e.is_unavailable()) {
            throw;
        }
        Logger::log(LogLevel::WARN, "Progress: Store unavailable, saving " + key +
                                        " to the flat mirror only.");
        flat_.set_item(key, payload_text);
        return stamped;
    }

    try {
        flat_.set_item(key, payload_text);
    } catch (const StoreError& e) {
        Logger::log(LogLevel::WARN, "Progress: Mirror write failed for " + key + ": " + e.what());
    }

    Logger::log(LogLevel::DEBUG, "Progress: Saved " + key + " (" +
                                     std::to_string(static_cast<int>(stamped.progress.percentage)) +
                                     "%, completed=" +
                                     (stamped.progress.is_completed ? "true" : "false") + ").");
    return stamped;
}

std::vector<ProgressEntry> ProgressLedger::scan_mirror(const std::string& prefix,
                                                       const std::string& user_id,
                                                       const std::optional<std::string>& course_id)
{
    std::vector<ProgressEntry> entries;
    for (const auto& key : flat_.keys_with_prefix(prefix)) {
        std::optional<std::string> text = flat_.get_item(key);
        Json::Ptr node;
        if (text) {
            node = Json::parse(*text);
        }
        if (!cJSON_IsObject(node.get())) {
            Logger::log(LogLevel::WARN, "Progress: Skipping unreadable mirror entry " + key);
            continue;
        }
        ProgressEntry entry;
        from_json(node.get(), entry);
        if (owned_by(entry, user_id, course_id)) {
            entries.push_back(std::move(entry));
        }
    }
    return entries;
}

/**
 * @brief Prefix scan over the document store, or over the mirror when the
 * store is unavailable.
 *
 * Ids may contain `_`, so the prefix of user `u` also covers user `u_x`.
 * Entries are kept only when their own ids match.
 */
std::vector<ProgressEntry> ProgressLedger::scan(const std::string& prefix,
                                                const std::string& user_id,
                                                const std::optional<std::string>& course_id)
{
    std::vector<storage::Document> docs;
    try {
        docs = store_.all_docs_with_prefix(prefix);
    } catch (const StoreError& e) {
        if (!e.is_unavailable()) {
            throw;
        }
        return scan_mirror(prefix, user_id, course_id);
    }

    std::vector<ProgressEntry> entries;
    for (const auto& doc : docs) {
        Json::Ptr envelope = Json::parse(doc.body);
        const cJSON* payload = Json::child(envelope.get(), "payload");
        if (!payload) {
            Logger::log(LogLevel::WARN, "Progress: Skipping malformed document " + doc.key);
            continue;
        }
        ProgressEntry entry;
        from_json(payload, entry);
        if (owned_by(entry, user_id, course_id)) {
            entries.push_back(std::move(entry));
        }
    }
    return entries;
}

std::optional<LessonProgress> ProgressLedger::get_progress(
    const std::string& user_id, const std::string& course_id,
    const std::optional<std::string>& lesson_id)
{
    const std::string key = progress_key(user_id, course_id, lesson_id);

    Json::Ptr node;
    try {
        std::optional<storage::Document> doc = store_.get(key);
        if (!doc) {
            return std::nullopt;
        }
        Json::Ptr envelope = Json::parse(doc->body);
        node = Json::clone(Json::child(envelope.get(), "payload"));
    } catch (const StoreError& e) {
        if (!e.is_unavailable()) {
            throw;
        }
        std::optional<std::string> text = flat_.get_item(key);
        if (!text) {
            return std::nullopt;
        }
        node = Json::parse(*text);
    }

    if (!cJSON_IsObject(node.get())) {
        return std::nullopt;
    }
    ProgressEntry entry;
    from_json(node.get(), entry);
    return entry.progress;
}

std::optional<CourseProgress> ProgressLedger::get_course_progress(const std::string& user_id,
                                                                  const std::string& course_id)
{
    std::string prefix = std::string(kProgressPrefix) + user_id + "_" + course_id + "_";
    return aggregate_course_progress(course_id, scan(prefix, user_id, course_id));
}

std::vector<ProgressEntry> ProgressLedger::get_all_user_progress(const std::string& user_id)
{
    return scan(std::string(kProgressPrefix) + user_id + "_", user_id, std::nullopt);
}

bool ProgressLedger::delete_progress(const std::string& user_id, const std::string& course_id,
                                     const std::optional<std::string>& lesson_id)
{
    const std::string key = progress_key(user_id, course_id, lesson_id);

    try {
        store_.remove_if_present(key);
    } catch (const StoreError& e) {
        if (!e.is_unavailable()) {
            throw;
        }
    }
    flat_.remove_item(key);

    Logger::log(LogLevel::DEBUG, "Progress: Deleted " + key);
    return true;
}

bool ProgressLedger::clear_all_progress(const std::string& user_id)
{
    const std::string prefix = std::string(kProgressPrefix) + user_id + "_";
    bool all_removed = true;

    std::vector<storage::Document> docs;
    try {
        docs = store_.all_docs_with_prefix(prefix);
    } catch (const StoreError& e) {
        if (!e.is_unavailable()) {
            Logger::log(LogLevel::ERROR, std::string("Progress: Cannot list entries: ") + e.what());
            all_removed = false;
        }
    }

    for (const auto& doc : docs) {
        Json::Ptr envelope = Json::parse(doc.body);
        if (!stored_for_user(Json::child(envelope.get(), "payload"), user_id)) {
            continue;
        }
        try {
            if (doc.revision) {
                store_.remove(doc.key, *doc.revision);
            }
        } catch (const StoreError& e) {
            Logger::log(LogLevel::ERROR,
                        "Progress: Failed to delete " + doc.key + ": " + e.what());
            all_removed = false;
        }
    }

    for (const auto& key : flat_.keys_with_prefix(prefix)) {
        std::optional<std::string> text = flat_.get_item(key);
        Json::Ptr node = text ? Json::parse(*text) : Json::Ptr();
        if (!stored_for_user(node.get(), user_id)) {
            continue;
        }
        try {
            flat_.remove_item(key);
        } catch (const StoreError& e) {
            Logger::log(LogLevel::ERROR,
                        "Progress: Failed to delete mirror entry " + key + ": " + e.what());
            all_removed = false;
        }
    }

    Logger::log(all_removed ? LogLevel::INFO : LogLevel::WARN,
                "Progress: Cleared progress for user " + user_id +
                    (all_removed ? "." : " with failures."));
    return all_removed;
}

DatabaseInfo ProgressLedger::database_info()
{
    DatabaseInfo result;
    result.state = storage::to_string(store_.state());
    try {
        storage::EngineInfo info = store_.info();
        result.available = true;
        result.database_name = info.name;
        result.document_count = info.document_count;
        result.update_seq = info.update_seq;
        result.is_fallback = info.is_fallback;
        result.progress_documents = store_.all_docs_with_prefix(kProgressPrefix).size();
    } catch (const StoreError& e) {
        result.available = false;
        result.error = e.what();
    }
    return result;
}

} // namespace aula::progress
