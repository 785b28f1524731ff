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
 * @file document_store.hpp
 * @brief Process-wide revisioned document store with engine failover.
 *
 * @details
 * `DocumentStore` owns exactly one `StorageEngine`, chosen once by `init()`:
 * the primary engine if it opens within the retry budget, otherwise the
 * in-memory fallback. Every higher layer (entity cache, progress ledger,
 * learner cache) receives the store by reference at construction time.
 */

#pragma once

#include "aula/storage/engine.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace aula::storage {

/**
 * @enum StoreState
 * @brief Initialization state machine.
 *
 * `UNINITIALIZED -> INITIALIZING -> READY`, or
 * `INITIALIZING -> FAILED -> INITIALIZING` (retry) `-> FALLBACK_READY`.
 * `UNAVAILABLE` is terminal: neither engine could be opened.
 */
enum class StoreState { UNINITIALIZED, INITIALIZING, READY, FAILED, FALLBACK_READY, UNAVAILABLE };

const char* to_string(StoreState state);

/**
 * @struct StoreOptions
 * @brief Retry and fallback policy for `DocumentStore::init()`.
 */
struct StoreOptions {
    int max_attempts = 3;
    std::chrono::milliseconds backoff{1000}; ///< Multiplied by the attempt number.
    bool fallback_enabled = true;
    std::size_t fallback_capacity = 0;       ///< Document limit of the fallback; 0 = unlimited.
};

/// @brief Builds a fresh, unopened engine. Called once per attempt.
using EngineFactory = std::function<std::unique_ptr<StorageEngine>()>;

/**
 * @class DocumentStore
 * @brief Thread-safe facade over the selected storage engine.
 *
 * @details
 * **Concurrency Control:** a `std::shared_mutex` gives concurrent readers
 * (`get`, `all_docs`, `info`) and exclusive writers (`put`, `remove`,
 * `upsert`, `destroy`). `upsert` holds the writer lock across its read and
 * write, so its read-modify-write is atomic with respect to other callers.
 *
 * Before `init()` completes, and after both engines failed, every operation
 * raises `StoreError(UNAVAILABLE, "offline data unavailable")`.
 */
class DocumentStore {
  public:
    /**
     * @param primary Factory of the durable engine.
     * @param options Retry and fallback policy.
     * @param fallback Factory of the fallback engine; defaults to `MemoryEngine`.
     */
    explicit DocumentStore(EngineFactory primary, StoreOptions options = {},
                           EngineFactory fallback = nullptr);

    /**
     * @brief Runs the initialization protocol.
     *
     * Tries the primary engine up to `max_attempts` times, sleeping
     * `backoff * attempt` between attempts. Each attempt must pass a self-test
     * (`info()`) before the engine is exposed. Idempotent once settled in
     * `READY` or `FALLBACK_READY`.
     *
     * @return The settled state (`READY`, `FALLBACK_READY` or `UNAVAILABLE`).
     */
    StoreState init();

    StoreState state() const;

    /// @brief Diagnostics only. Call sites must not branch on it.
    bool is_fallback() const;

    /// @brief Message of the last engine failure seen by `init()`.
    std::string last_error() const;

    std::string put(const Document& doc);
    std::optional<Document> get(const std::string& key);
    std::vector<Document> all_docs(const KeyRange& range = KeyRange::all());

    /// @brief Key-ordered documents whose key starts with `prefix`.
    std::vector<Document> all_docs_with_prefix(const std::string& prefix);

    bool remove(const std::string& key, const std::string& revision);

    /**
     * @brief Deletes `key` at whatever revision it currently holds.
     *
     * @return false when the key was absent.
     */
    bool remove_if_present(const std::string& key);

    /**
     * @brief Builds the new body from the current document (if any).
     *
     * Receives `std::nullopt` when the key does not exist yet.
     */
    using Mutator = std::function<std::string(const std::optional<Document>& current)>;

    /**
     * @brief The single read-modify-write primitive.
     *
     * Reads `key`, hands the current document to `mutate`, and writes the
     * result carrying the observed revision (or none, for a create).
     *
     * @return The new revision.
     */
    std::string upsert(const std::string& key, const Mutator& mutate);

    EngineInfo info();

    /// @brief Removes every document from the active engine (logout / clear).
    void destroy();

  private:
    StorageEngine& engine() const;
    bool try_open(StorageEngine& engine);

    EngineFactory primary_;
    EngineFactory fallback_;
    StoreOptions options_;

    std::unique_ptr<StorageEngine> engine_;
    StoreState state_ = StoreState::UNINITIALIZED;
    std::string last_error_;

    mutable std::shared_mutex rw_lock_;
};

} // namespace aula::storage
