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
 * @file flat_store.hpp
 * @brief Flat string key/value storage, independent of the document store.
 *
 * @details
 * Holds the identity shadow (`currentUserId`, `userEmail`, ...), the progress
 * mirror, the sync queue list and small markers such as `cache_version` and
 * `lastSyncAt`. It shares no code path with the storage engines, so it keeps
 * working when the document store is unavailable.
 */

#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace aula::storage {

/**
 * @class FlatStore
 * @brief Thread-safe string map, optionally persisted to one JSON file.
 *
 * Each mutation rewrites the whole file atomically (temp file + rename). If the
 * write fails the in-memory change is rolled back and a `StoreError` is raised
 * (`QUOTA_EXCEEDED` when the byte budget is exhausted, `ENGINE_FAILURE`
 * otherwise). An empty path makes the store volatile.
 */
class FlatStore {
  public:
    explicit FlatStore(std::string file_path = "", std::size_t quota_bytes = 0);

    /**
     * @brief Loads the persisted map. A missing file yields an empty store;
     * an unreadable one is logged and ignored.
     */
    void load();

    void set_item(const std::string& key, const std::string& value);
    std::optional<std::string> get_item(const std::string& key) const;

    /// @return false when the key was absent.
    bool remove_item(const std::string& key);

    /// @brief Sorted keys starting with `prefix`.
    std::vector<std::string> keys_with_prefix(const std::string& prefix) const;

    void clear();

    std::size_t size() const;

    /// @brief Bytes counted against the quota (keys plus values).
    std::size_t used_bytes() const;

    bool is_persistent() const { return !file_path_.empty(); }

  private:
    void persist_locked() const;

    std::string file_path_;
    std::size_t quota_bytes_;
    std::map<std::string, std::string> items_;
    std::size_t used_bytes_ = 0;
    mutable std::mutex mutex_;
};

} // namespace aula::storage
