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
 * @file document_store.cpp
 * @brief Implementation of the engine-selecting document store.
 */

#include "aula/storage/document_store.hpp"

#include "aula/infra/logger.hpp"
#include "aula/storage/errors.hpp"
#include "aula/storage/memory_engine.hpp"

#include <exception>
#include <mutex>
#include <thread>

namespace aula::storage {

const char* to_string(StoreState state)
{
    switch (state) {
    case StoreState::UNINITIALIZED:
        return "uninitialized";
    case StoreState::INITIALIZING:
        return "initializing";
    case StoreState::READY:
        return "ready";
    case StoreState::FAILED:
        return "failed";
    case StoreState::FALLBACK_READY:
        return "fallback";
    case StoreState::UNAVAILABLE:
        return "unavailable";
    }
    return "unknown";
}

DocumentStore::DocumentStore(EngineFactory primary, StoreOptions options, EngineFactory fallback)
    : primary_(std::move(primary)), fallback_(std::move(fallback)), options_(options)
{
    if (!fallback_) {
        std::size_t capacity = options_.fallback_capacity;
        fallback_ = [capacity]() {
            return std::make_unique<MemoryEngine>("aula_local_fallback", capacity);
        };
    }
    if (options_.max_attempts < 1) {
        options_.max_attempts = 1;
    }
}

/**
 * @brief Opens an engine and runs the self-test.
 *
 * @return false (with `last_error_` set) if either step failed.
 */
bool DocumentStore::try_open(StorageEngine& engine)
{
    try {
        engine.open();
        engine.info();
        return true;
    } catch (const std::exception& e) {
        last_error_ = e.what();
        return false;
    }
}

StoreState DocumentStore::init()
{
    std::unique_lock lock(rw_lock_);

    if (state_ == StoreState::READY || state_ == StoreState::FALLBACK_READY) {
        return state_;
    }

    for (int attempt = 1; attempt <= options_.max_attempts; ++attempt) {
        state_ = StoreState::INITIALIZING;

        std::unique_ptr<StorageEngine> candidate;
        if (primary_) {
            try {
                candidate = primary_();
            } catch (const std::exception& e) {
                last_error_ = e.what();
            }
        } else {
            last_error_ = "no primary engine configured";
        }

        if (candidate && try_open(*candidate)) {
            engine_ = std::move(candidate);
            state_ = StoreState::READY;
            infra::Logger::log(infra::LogLevel::INFO, "Store: Primary engine ready ('" +
                                                          engine_->name() + "', attempt " +
                                                          std::to_string(attempt) + ").");
            return state_;
        }

        state_ = StoreState::FAILED;
        infra::Logger::log(infra::LogLevel::WARN,
                           "Store: Initialization attempt " + std::to_string(attempt) + "/" +
                               std::to_string(options_.max_attempts) + " failed: " + last_error_);

        if (attempt < options_.max_attempts && options_.backoff.count() > 0) {
            std::this_thread::sleep_for(options_.backoff * attempt);
        }
    }

    if (!options_.fallback_enabled) {
        state_ = StoreState::UNAVAILABLE;
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Store: Offline data unavailable (fallback disabled).");
        return state_;
    }

    std::unique_ptr<StorageEngine> fallback;
    try {
        fallback = fallback_();
    } catch (const std::exception& e) {
        last_error_ = e.what();
    }

    if (fallback && try_open(*fallback)) {
        engine_ = std::move(fallback);
        state_ = StoreState::FALLBACK_READY;
        infra::Logger::log(infra::LogLevel::WARN,
                           "Store: Running on the in-memory fallback engine. Data will not "
                           "survive a restart.");
        return state_;
    }

    state_ = StoreState::UNAVAILABLE;
    infra::Logger::log(infra::LogLevel::ERROR,
                       "Store: Offline data unavailable. Fallback engine failed: " + last_error_);
    return state_;
}

StoreState DocumentStore::state() const
{
    std::shared_lock lock(rw_lock_);
    return state_;
}

bool DocumentStore::is_fallback() const
{
    std::shared_lock lock(rw_lock_);
    return engine_ && engine_->is_fallback();
}

std::string DocumentStore::last_error() const
{
    std::shared_lock lock(rw_lock_);
    return last_error_;
}

/// @pre Caller holds `rw_lock_` (shared or exclusive).
StorageEngine& DocumentStore::engine() const
{
    if (!engine_ || (state_ != StoreState::READY && state_ != StoreState::FALLBACK_READY)) {
        throw StoreError(ErrorCode::UNAVAILABLE, "offline data unavailable");
    }
    return *engine_;
}

std::string DocumentStore::put(const Document& doc)
{
    std::unique_lock lock(rw_lock_);
    std::string revision = engine().put(doc);
    infra::Logger::log(infra::LogLevel::TRACE, "Store: put " + doc.key + " -> " + revision);
    return revision;
}

std::optional<Document> DocumentStore::get(const std::string& key)
{
    std::shared_lock lock(rw_lock_);
    return engine().get(key);
}

std::vector<Document> DocumentStore::all_docs(const KeyRange& range)
{
    std::shared_lock lock(rw_lock_);
    return engine().all_docs(range);
}

std::vector<Document> DocumentStore::all_docs_with_prefix(const std::string& prefix)
{
    return all_docs(KeyRange::prefix(prefix));
}

bool DocumentStore::remove(const std::string& key, const std::string& revision)
{
    std::unique_lock lock(rw_lock_);
    return engine().remove(key, revision);
}

bool DocumentStore::remove_if_present(const std::string& key)
{
    std::unique_lock lock(rw_lock_);
    StorageEngine& active = engine();
    std::optional<Document> current = active.get(key);
    if (!current || !current->revision) {
        return false;
    }
    return active.remove(key, *current->revision);
}

std::string DocumentStore::upsert(const std::string& key, const Mutator& mutate)
{
    std::unique_lock lock(rw_lock_);
    StorageEngine& active = engine();

    std::optional<Document> current = active.get(key);

    Document next;
    next.key = key;
    next.body = mutate(current);
    if (current) {
        next.revision = current->revision;
    }

    std::string revision = active.put(next);
    infra::Logger::log(infra::LogLevel::TRACE, "Store: upsert " + key + " -> " + revision);
    return revision;
}

EngineInfo DocumentStore::info()
{
    std::shared_lock lock(rw_lock_);
    return engine().info();
}

void DocumentStore::destroy()
{
    std::unique_lock lock(rw_lock_);
    engine().destroy();
    infra::Logger::log(infra::LogLevel::INFO, "Store: All local documents destroyed.");
}

} // namespace aula::storage
