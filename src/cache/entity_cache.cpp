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
 * @file entity_cache.cpp
 * @brief Implementation of the entity cache layer.
 */

#include "aula/cache/entity_cache.hpp"

#include "aula/infra/clock.hpp"
#include "aula/infra/logger.hpp"
#include "aula/storage/errors.hpp"

#include <algorithm>

namespace aula::cache {

using infra::Json;
using storage::StoreError;

EntityCache::EntityCache(storage::DocumentStore& store, storage::FlatStore& flat)
    : store_(store), flat_(flat)
{
}

// ============================================================================
//  Envelope helpers
// ============================================================================

void EntityCache::write_entity(const char* type, const char* prefix, const std::string& id,
                               const cJSON* payload)
{
    if (id.empty()) {
        throw StoreError(storage::ErrorCode::INVALID_ARGUMENT,
                         std::string("Cannot cache ") + type + " without an id");
    }

    std::string key = prefix + id;
    std::string now = infra::Clock::now_iso8601();

    store_.upsert(key, [&](const std::optional<storage::Document>& current) {
        std::string cached_at = now;
        if (current) {
            Json::Ptr previous = Json::parse(current->body);
            cached_at = Json::get_string(previous.get(), "cachedAt", now);
        }

        Json::Ptr envelope = Json::object();
        Json::set_string(envelope.get(), "type", type);
        Json::set_string(envelope.get(), "entityId", id);
        Json::set_item(envelope.get(), "payload", Json::clone(payload));
        Json::set_string(envelope.get(), "cachedAt", cached_at);
        Json::set_string(envelope.get(), "lastUpdated", now);
        return Json::print(envelope.get());
    });

    infra::Logger::log(infra::LogLevel::DEBUG, std::string("Cache: Stored ") + key);
}

Json::Ptr EntityCache::read_payload(const char* prefix, const std::string& id)
{
    std::optional<storage::Document> doc = store_.get(prefix + id);
    if (!doc) {
        return nullptr;
    }
    Json::Ptr envelope = Json::parse(doc->body);
    const cJSON* payload = Json::child(envelope.get(), "payload");
    if (!payload) {
        infra::Logger::log(infra::LogLevel::WARN,
                           "Cache: Ignoring malformed document " + doc->key);
        return nullptr;
    }
    return Json::clone(payload);
}

std::vector<Json::Ptr> EntityCache::read_all(const char* prefix)
{
    std::vector<Json::Ptr> payloads;
    for (const auto& doc : store_.all_docs_with_prefix(prefix)) {
        Json::Ptr envelope = Json::parse(doc.body);
        const cJSON* payload = Json::child(envelope.get(), "payload");
        if (payload) {
            payloads.push_back(Json::clone(payload));
        }
    }
    return payloads;
}

std::size_t EntityCache::clear_prefix(const char* prefix)
{
    std::size_t removed = 0;
    for (const auto& doc : store_.all_docs_with_prefix(prefix)) {
        if (doc.revision && store_.remove(doc.key, *doc.revision)) {
            ++removed;
        }
    }
    infra::Logger::log(infra::LogLevel::INFO, "Cache: Cleared " + std::to_string(removed) +
                                                  " documents under '" + prefix + "'.");
    return removed;
}

// ============================================================================
//  Users
// ============================================================================

void EntityCache::write_identity_shadow(const User& user)
{
    flat_.set_item(shadow::kUserId, user.id);
    flat_.set_item(shadow::kName, user.name);
    flat_.set_item(shadow::kEmail, user.email);
    flat_.set_item(shadow::kRole, to_string(user.role));
    flat_.set_item(shadow::kAvatar, user.avatar.value_or(""));
    flat_.set_item(shadow::kVerified, user.verified ? "true" : "false");
}

void EntityCache::cache_user(const User& user)
{
    write_identity_shadow(user);

    Json::Ptr payload = to_json(user);
    write_entity("user", kUserPrefix, user.id, payload.get());
}

std::optional<User> EntityCache::shadow_user() const
{
    std::optional<std::string> id = flat_.get_item(shadow::kUserId);
    if (!id || id->empty()) {
        return std::nullopt;
    }

    User user;
    user.id = *id;
    user.name = flat_.get_item(shadow::kName).value_or("");
    user.email = flat_.get_item(shadow::kEmail).value_or("");
    user.role = parse_user_role(flat_.get_item(shadow::kRole).value_or("learner"));
    std::string avatar = flat_.get_item(shadow::kAvatar).value_or("");
    if (!avatar.empty()) {
        user.avatar = avatar;
    }
    user.verified = flat_.get_item(shadow::kVerified).value_or("false") == "true";
    return user;
}

void EntityCache::clear_identity_shadow()
{
    for (const char* key : {shadow::kUserId, shadow::kName, shadow::kEmail, shadow::kRole,
                            shadow::kAvatar, shadow::kVerified}) {
        flat_.remove_item(key);
    }
}

std::optional<User> EntityCache::get_cached_user(const std::string& user_id)
{
    Json::Ptr payload;
    try {
        payload = read_payload(kUserPrefix, user_id);
    } catch (const StoreError& e) {
        if (!e.is_unavailable()) {
            throw;
        }
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "Cache: Store unavailable, reading identity shadow.");
    }

    if (payload) {
        User user;
        from_json(payload.get(), user);
        return user;
    }

    std::optional<User> shadowed = shadow_user();
    if (shadowed && shadowed->id == user_id) {
        return shadowed;
    }
    return std::nullopt;
}

void EntityCache::update_cached_user(const User& user)
{
    cache_user(user);
}

bool EntityCache::remove_cached_user(const std::string& user_id)
{
    return store_.remove_if_present(kUserPrefix + user_id);
}

std::vector<User> EntityCache::get_all_cached_users()
{
    std::vector<User> users;
    for (const auto& payload : read_all(kUserPrefix)) {
        User user;
        from_json(payload.get(), user);
        users.push_back(std::move(user));
    }
    return users;
}

std::size_t EntityCache::clear_all_cached_users()
{
    return clear_prefix(kUserPrefix);
}

bool EntityCache::is_user_cached(const std::string& user_id)
{
    return get_cached_user(user_id).has_value();
}

// ============================================================================
//  Courses
// ============================================================================

Course EntityCache::cache_course(const Course& course)
{
    Course normalized = course;
    if (normalized.title.empty())
        normalized.title = "Untitled Course";
    if (normalized.instructor_name.empty())
        normalized.instructor_name = "Unknown Instructor";
    if (normalized.category.empty())
        normalized.category = "General";
    if (normalized.level.empty())
        normalized.level = "Beginner";
    if (normalized.status.empty())
        normalized.status = "published";
    if (normalized.total_modules == 0)
        normalized.total_modules = static_cast<int>(normalized.sections.size());
    normalized.last_cached = infra::Clock::now_iso8601();
    normalized.offline_accessible = true;

    Json::Ptr payload = to_json(normalized);
    write_entity("course", kCoursePrefix, normalized.id, payload.get());
    return normalized;
}

std::optional<Course> EntityCache::get_cached_course(const std::string& course_id)
{
    Json::Ptr payload = read_payload(kCoursePrefix, course_id);
    if (!payload) {
        return std::nullopt;
    }
    Course course;
    from_json(payload.get(), course);
    return course;
}

void EntityCache::update_cached_course(const Course& course)
{
    Json::Ptr payload = to_json(course);
    write_entity("course", kCoursePrefix, course.id, payload.get());
}

bool EntityCache::remove_cached_course(const std::string& course_id)
{
    return store_.remove_if_present(kCoursePrefix + course_id);
}

std::vector<Course> EntityCache::get_all_cached_courses()
{
    std::vector<Course> courses;
    for (const auto& payload : read_all(kCoursePrefix)) {
        Course course;
        from_json(payload.get(), course);
        courses.push_back(std::move(course));
    }
    return courses;
}

std::size_t EntityCache::clear_all_cached_courses()
{
    return clear_prefix(kCoursePrefix);
}

std::vector<Course> EntityCache::get_enrolled_courses()
{
    std::vector<Course> courses = get_all_cached_courses();
    courses.erase(std::remove_if(courses.begin(), courses.end(),
                                 [](const Course& c) {
                                     return !(c.is_enrolled || c.enrollment.has_value() ||
                                              c.status == "enrolled");
                                 }),
                  courses.end());
    return courses;
}

std::optional<Course> EntityCache::get_course_offline(const std::string& course_id)
{
    std::string id = course_id;
    std::string prefix = kCoursePrefix;
    if (id.compare(0, prefix.size(), prefix) == 0) {
        id = id.substr(prefix.size());
    }
    return get_cached_course(id);
}

// ============================================================================
//  Modules
// ============================================================================

void EntityCache::cache_module(const Module& module)
{
    Json::Ptr payload = to_json(module);
    write_entity("module", kModulePrefix, module.id, payload.get());
}

std::optional<Module> EntityCache::get_cached_module(const std::string& module_id)
{
    Json::Ptr payload = read_payload(kModulePrefix, module_id);
    if (!payload) {
        return std::nullopt;
    }
    Module module;
    from_json(payload.get(), module);
    return module;
}

void EntityCache::update_cached_module(const Module& module)
{
    cache_module(module);
}

bool EntityCache::remove_cached_module(const std::string& module_id)
{
    return store_.remove_if_present(kModulePrefix + module_id);
}

std::vector<Module> EntityCache::get_all_cached_modules()
{
    std::vector<Module> modules;
    for (const auto& payload : read_all(kModulePrefix)) {
        Module module;
        from_json(payload.get(), module);
        modules.push_back(std::move(module));
    }
    return modules;
}

std::size_t EntityCache::clear_all_cached_modules()
{
    return clear_prefix(kModulePrefix);
}

std::vector<Module> EntityCache::get_cached_modules_by_course(const std::string& course_id)
{
    std::vector<Module> modules = get_all_cached_modules();
    modules.erase(std::remove_if(modules.begin(), modules.end(),
                                 [&](const Module& m) { return m.course_id != course_id; }),
                  modules.end());
    std::stable_sort(modules.begin(), modules.end(),
                     [](const Module& a, const Module& b) { return a.order < b.order; });
    return modules;
}

// ============================================================================
//  Attachments
// ============================================================================

void EntityCache::cache_attachment(const Attachment& attachment)
{
    Json::Ptr payload = to_json(attachment);
    write_entity("attachment", kAttachmentPrefix, attachment.id, payload.get());
}

std::optional<Attachment> EntityCache::get_cached_attachment(const std::string& attachment_id)
{
    Json::Ptr payload = read_payload(kAttachmentPrefix, attachment_id);
    if (!payload) {
        return std::nullopt;
    }
    Attachment attachment;
    from_json(payload.get(), attachment);
    return attachment;
}

void EntityCache::update_cached_attachment(const Attachment& attachment)
{
    cache_attachment(attachment);
}

bool EntityCache::remove_cached_attachment(const std::string& attachment_id)
{
    return store_.remove_if_present(kAttachmentPrefix + attachment_id);
}

std::vector<Attachment> EntityCache::get_all_cached_attachments()
{
    std::vector<Attachment> attachments;
    for (const auto& payload : read_all(kAttachmentPrefix)) {
        Attachment attachment;
        from_json(payload.get(), attachment);
        attachments.push_back(std::move(attachment));
    }
    return attachments;
}

std::size_t EntityCache::clear_all_cached_attachments()
{
    return clear_prefix(kAttachmentPrefix);
}

std::vector<Attachment> EntityCache::get_attachments_by_module(const std::string& module_id)
{
    std::vector<Attachment> attachments = get_all_cached_attachments();
    attachments.erase(std::remove_if(attachments.begin(), attachments.end(),
                                     [&](const Attachment& a) { return a.module_id != module_id; }),
                      attachments.end());
    return attachments;
}

} // namespace aula::cache
