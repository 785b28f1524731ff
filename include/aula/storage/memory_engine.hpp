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
 * @file memory_engine.hpp
 * @brief Volatile fallback engine.
 */

#pragma once

#include "aula/storage/engine.hpp"

#include <cstdint>
#include <map>
#include <string>

namespace aula::storage {

/**
 * @class MemoryEngine
 * @brief Process-local engine used when the durable engine cannot start.
 *
 * @details
 * Honours the full `StorageEngine` contract (revisions, conflicts, key-ordered
 * ranges), so callers see no difference other than data not surviving a
 * restart. Revisions take the form `<generation>-<epoch millis>`.
 *
 * An optional document capacity emulates a storage quota.
 */
class MemoryEngine : public StorageEngine {
  public:
    explicit MemoryEngine(std::string name = "aula_local_fallback", std::size_t capacity = 0);

    void open() override;
    std::string put(const Document& doc) override;
    std::optional<Document> get(const std::string& key) override;
    std::vector<Document> all_docs(const KeyRange& range) override;
    bool remove(const std::string& key, const std::string& revision) override;
    EngineInfo info() override;
    void destroy() override;
    std::string name() const override { return name_; }
    bool is_fallback() const override { return true; }

  private:
    struct Record {
        std::string revision;
        std::string body;
    };

    std::string name_;
    std::size_t capacity_;
    std::map<std::string, Record> records_;
    std::uint64_t update_seq_ = 0;
};

} // namespace aula::storage
