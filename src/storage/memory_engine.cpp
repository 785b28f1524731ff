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
 * @file memory_engine.cpp
 * @brief Implementation of the volatile fallback engine.
 */

#include "aula/storage/memory_engine.hpp"

#include "aula/infra/clock.hpp"
#include "aula/storage/errors.hpp"

namespace aula::storage {

MemoryEngine::MemoryEngine(std::string name, std::size_t capacity)
    : name_(std::move(name)), capacity_(capacity)
{
}

void MemoryEngine::open()
{
    records_.clear();
    update_seq_ = 0;
}

std::string MemoryEngine::put(const Document& doc)
{
    if (doc.key.empty()) {
        throw StoreError(ErrorCode::INVALID_ARGUMENT, "Document key must not be empty");
    }

    std::optional<std::string> stored;
    auto it = records_.find(doc.key);
    if (it != records_.end()) {
        stored = it->second.revision;
    }
    check_revision(doc.key, stored, doc.revision);

    if (!stored && capacity_ > 0 && records_.size() >= capacity_) {
        throw StoreError(ErrorCode::QUOTA_EXCEEDED,
                         "In-memory store is full (" + std::to_string(capacity_) + " documents)");
    }

    std::uint64_t generation = stored ? revision_generation(*stored) + 1 : 1;
    std::string revision =
        std::to_string(generation) + "-" + std::to_string(infra::Clock::epoch_millis());

    records_[doc.key] = Record{revision, doc.body};
    ++update_seq_;
    return revision;
}

std::optional<Document> MemoryEngine::get(const std::string& key)
{
    auto it = records_.find(key);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return Document{key, it->second.revision, it->second.body};
}

std::vector<Document> MemoryEngine::all_docs(const KeyRange& range)
{
    std::vector<Document> docs;
    for (auto it = records_.lower_bound(range.start); it != records_.end(); ++it) {
        if (!range.contains(it->first)) {
            break;
        }
        docs.push_back(Document{it->first, it->second.revision, it->second.body});
    }
    return docs;
}

bool MemoryEngine::remove(const std::string& key, const std::string& revision)
{
    auto it = records_.find(key);
    if (it == records_.end()) {
        return false;
    }
    check_revision(key, it->second.revision, revision);
    records_.erase(it);
    ++update_seq_;
    return true;
}

EngineInfo MemoryEngine::info()
{
    return EngineInfo{name_, "memory", records_.size(), update_seq_, true};
}

void MemoryEngine::destroy()
{
    records_.clear();
    ++update_seq_;
}

} // namespace aula::storage
