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
 * @file entity_cache.hpp
 * @brief Typed CRUD helpers for users, courses, modules and attachments.
 *
 * @details
 * Every entity lives in the document store under `{type}_{id}` inside an
 * envelope:
 *
 * @code
 * { "type": "course", "entityId": "c1", "payload": { ... },
 *   "cachedAt": "2026-01-01T00:00:00.000Z", "lastUpdated": "..." }
 * @endcode
 *
 * All writes go through `DocumentStore::upsert`, so the revision of the
 * current document is always carried into the replacement and repeated
 * writes of the same entity never conflict.
 *
 * Storage errors propagate untouched. A missing document is `std::nullopt`.
 */

#pragma once

#include "aula/cache/entities.hpp"
#include "aula/storage/document_store.hpp"
#include "aula/storage/flat_store.hpp"

#include <optional>
#include <string>
#include <vector>

namespace aula::cache {

/// @brief Key prefixes. Disjoint across entity kinds.
inline constexpr const char* kUserPrefix = "user_";
inline constexpr const char* kCoursePrefix = "course_";
inline constexpr const char* kModulePrefix = "module_";
inline constexpr const char* kAttachmentPrefix = "attachment_";

/// @brief Flat identity shadow keys.
namespace shadow {
inline constexpr const char* kUserId = "currentUserId";
inline constexpr const char* kName = "userName";
inline constexpr const char* kEmail = "userEmail";
inline constexpr const char* kRole = "userRole";
inline constexpr const char* kAvatar = "userAvatar";
inline constexpr const char* kVerified = "userVerified";
} // namespace shadow

class EntityCache {
  public:
    EntityCache(storage::DocumentStore& store, storage::FlatStore& flat);

    // ========================================================================
    //  USERS
    // ========================================================================

    /**
     * @brief Stores the user document and mirrors identity fields into the
     * flat shadow (`currentUserId`, `userName`, `userEmail`, `userRole`,
     * `userAvatar`, `userVerified`).
     */
    void cache_user(const User& user);

    /**
     * @brief Reads a cached user.
     *
     * When the document is absent, or the store is unavailable, the identity
     * shadow is consulted if it belongs to `user_id`.
     */
    std::optional<User> get_cached_user(const std::string& user_id);

    void update_cached_user(const User& user);
    bool remove_cached_user(const std::string& user_id);
    std::vector<User> get_all_cached_users();
    std::size_t clear_all_cached_users();
    bool is_user_cached(const std::string& user_id);

    /// @brief User rebuilt from the flat shadow alone, if one is stored.
    std::optional<User> shadow_user() const;

    void clear_identity_shadow();

    /// @brief Replaces every shadow field with `user`'s; absent avatars are stored empty.
    void write_identity_shadow(const User& user);

    // ========================================================================
    //  COURSES
    // ========================================================================

    /**
     * @brief Normalizes and stores a course.
     *
     * Missing title, instructor name, category, level and status get defaults;
     * `totalModules` falls back to the section count; `lastCached` is stamped
     * and `offlineAccessible` set.
     *
     * @return The course exactly as stored.
     */
    Course cache_course(const Course& course);

    std::optional<Course> get_cached_course(const std::string& course_id);

    /// @brief Replaces a cached course verbatim (no normalization).
    void update_cached_course(const Course& course);

    bool remove_cached_course(const std::string& course_id);
    std::vector<Course> get_all_cached_courses();
    std::size_t clear_all_cached_courses();

    /// @brief Courses flagged enrolled, carrying an enrollment, or with status `enrolled`.
    std::vector<Course> get_enrolled_courses();

    /// @brief Like `get_cached_course`, also accepting a `course_`-prefixed id.
    std::optional<Course> get_course_offline(const std::string& course_id);

    // ========================================================================
    //  MODULES
    // ========================================================================

    void cache_module(const Module& module);
    std::optional<Module> get_cached_module(const std::string& module_id);
    void update_cached_module(const Module& module);
    bool remove_cached_module(const std::string& module_id);
    std::vector<Module> get_all_cached_modules();
    std::size_t clear_all_cached_modules();

    /// @brief Modules of one course, sorted by `order`.
    std::vector<Module> get_cached_modules_by_course(const std::string& course_id);

    // ========================================================================
    //  ATTACHMENTS
    // ========================================================================

    void cache_attachment(const Attachment& attachment);
    std::optional<Attachment> get_cached_attachment(const std::string& attachment_id);
    void update_cached_attachment(const Attachment& attachment);
    bool remove_cached_attachment(const std::string& attachment_id);
    std::vector<Attachment> get_all_cached_attachments();
    std::size_t clear_all_cached_attachments();
    std::vector<Attachment> get_attachments_by_module(const std::string& module_id);

    storage::DocumentStore& store() { return store_; }

  private:
    /// @brief Wraps `payload` in the envelope and upserts it at `{prefix}{id}`.
    void write_entity(const char* type, const char* prefix, const std::string& id,
                      const cJSON* payload);

    /// @brief Payload of `{prefix}{id}`, or an empty handle when absent.
    infra::Json::Ptr read_payload(const char* prefix, const std::string& id);

    /// @brief Payloads of every document under `prefix`, in key order.
    std::vector<infra::Json::Ptr> read_all(const char* prefix);

    std::size_t clear_prefix(const char* prefix);

    storage::DocumentStore& store_;
    storage::FlatStore& flat_;
};

} // namespace aula::cache
