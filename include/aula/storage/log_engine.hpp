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
 * @file log_engine.hpp
 * @brief Durable primary engine built on an Append-Only Log.
 *
 * @details
 * Every write (create, replace or tombstone) is appended to a single log file
 * as a length-prefixed JSON frame. On `open()` the log is replayed into a
 * key-sorted in-memory index, which serves reads and prefix scans. Obsolete
 * frames are reclaimed by compaction.
 */

#pragma once

#include "aula/storage/engine.hpp"

#include <cstdint>
#include <map>
#include <string>

namespace aula::storage {

/**
 * @struct LogEngineOptions
 * @brief Location and limits of the primary engine.
 */
struct LogEngineOptions {
    std::string base_path;          ///< Directory holding the `.aev` log.
    std::string name = "aula_local"; ///< Logical database name and log file stem.
    std::uint64_t quota_bytes = 0;  ///< Maximum log size; 0 disables the check.
};

/**
 * @class LogEngine
 * @brief Append-only log engine with revision checking.
 *
 * **Frame format:** `[4-byte little-endian length][UTF-8 JSON]`, where the
 * JSON is `{"key", "rev", "body"}` for a live document or
 * `{"key", "rev", "deleted": true}` for a tombstone.
 *
 * **Failure modes on open:**
 * - Directory cannot be created or the log is not writable: `ENGINE_FAILURE`.
 * - A complete frame fails to parse (corrupted database): `ENGINE_FAILURE`.
 * - A torn trailing frame (crash mid-append) is truncated with a warning.
 *
 * @note Not internally synchronized; `DocumentStore` serializes access.
 */
class LogEngine : public StorageEngine {
  public:
    explicit LogEngine(LogEngineOptions options);

    void open() override;
    std::string put(const Document& doc) override;
    std::optional<Document> get(const std::string& key) override;
    std::vector<Document> all_docs(const KeyRange& range) override;
    bool remove(const std::string& key, const std::string& revision) override;
    EngineInfo info() override;
    void destroy() override;
    std::string name() const override { return options_.name; }
    bool is_fallback() const override { return false; }

    /**
     * @brief Rewrites the log with only the live documents.
     *
     * Writes a temporary file and renames it over the log, so the log is never
     * missing or half-written.
     *
     * @return true if the swap completed.
     */
    bool compact();

    /// @brief Absolute path of the log file.
    std::string path() const;

  private:
    struct Record {
        std::string revision;
        std::string body;
    };

    void ensure_open() const;
    void replay();
    void append_frame(const std::string& raw);
    void maybe_compact();

    LogEngineOptions options_;
    std::map<std::string, Record> records_;
    std::uint64_t update_seq_ = 0;
    std::uint64_t log_bytes_ = 0;
    std::size_t frame_count_ = 0;
    bool opened_ = false;
};

} // namespace aula::storage
