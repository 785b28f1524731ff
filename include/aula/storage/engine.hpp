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
 * @file engine.hpp
 * @brief Abstract storage engine contract shared by the primary and fallback engines.
 *
 * @details
 * The document store selects one engine at startup and holds it behind a
 * single pointer. Call sites never branch on which engine is active; both
 * implementations honour exactly the same revision and range semantics.
 */

#pragma once

#include "aula/storage/document.hpp"

#include <optional>
#include <string>
#include <vector>

namespace aula::storage {

/**
 * @class StorageEngine
 * @brief Revisioned key -> document persistence interface.
 *
 * **Write contract (`put`):**
 * - Key absent, no revision: create, return the first revision.
 * - Key present, matching revision: replace, return the next revision.
 * - Key present, revision missing or different: `StoreError(CONFLICT)`.
 * - Key absent, revision supplied: `StoreError(CONFLICT)`.
 */
class StorageEngine {
  public:
    virtual ~StorageEngine() = default;

    /**
     * @brief Acquires the backing store.
     *
     * @throws StoreError (`ENGINE_FAILURE`) when the store cannot be opened.
     */
    virtual void open() = 0;

    /// @brief Creates or replaces a document, returning its new revision.
    virtual std::string put(const Document& doc) = 0;

    /// @brief Fetches a document, or `std::nullopt` when absent.
    virtual std::optional<Document> get(const std::string& key) = 0;

    /// @brief Key-ordered documents within the half-open range.
    virtual std::vector<Document> all_docs(const KeyRange& range) = 0;

    /**
     * @brief Deletes a document.
     *
     * @return false when the key was absent.
     * @throws StoreError (`CONFLICT`) when `revision` is stale.
     */
    virtual bool remove(const std::string& key, const std::string& revision) = 0;

    virtual EngineInfo info() = 0;

    /// @brief Drops every document (logout / full cache reset).
    virtual void destroy() = 0;

    /// @brief Logical database name.
    virtual std::string name() const = 0;

    virtual bool is_fallback() const = 0;
};

/**
 * @brief Applies the write contract above.
 *
 * @param key Document key, for the error message.
 * @param stored Revision currently held by the engine, if any.
 * @param supplied Revision carried by the incoming document, if any.
 * @throws StoreError (`CONFLICT`) when the write must be rejected.
 */
void check_revision(const std::string& key, const std::optional<std::string>& stored,
                    const std::optional<std::string>& supplied);

/**
 * @brief Extracts the numeric generation prefix of a `<n>-<suffix>` revision.
 *
 * @return 0 for malformed revisions.
 */
std::uint64_t revision_generation(const std::string& revision);

} // namespace aula::storage
