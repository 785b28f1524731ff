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
 * @file log_engine.cpp
 * @brief Implementation of the durable append-only log engine.
 *
 * @details
 * Frames are `[4-byte Little Endian Length Header] + [N-byte UTF-8 JSON]`.
 * The length prefix gives strict record boundaries, so a crash in the middle
 * of an append leaves a detectable torn tail rather than a silently merged
 * record.
 */

#include "aula/storage/log_engine.hpp"

#include "aula/infra/id_generator.hpp"
#include "aula/infra/json.hpp"
#include "aula/infra/logger.hpp"
#include "aula/storage/errors.hpp"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace aula::storage {

using infra::Json;
using infra::LogLevel;
using infra::Logger;

namespace {

/// @brief Compaction starts once the log holds this many frames...
constexpr std::size_t kCompactionMinFrames = 100;

/// @brief ...and at least this many frames per live document.
constexpr std::size_t kCompactionRatio = 2;

void write_frame(std::ofstream& file, const std::string& raw)
{
    uint32_t length = static_cast<uint32_t>(raw.size());
    file.write(reinterpret_cast<const char*>(&length), sizeof(length));
    file.write(raw.data(), length);
}

std::string encode_live(const std::string& key, const std::string& revision,
                        const std::string& body)
{
    Json::Ptr frame = Json::object();
    Json::set_string(frame.get(), "key", key);
    Json::set_string(frame.get(), "rev", revision);
    Json::set_string(frame.get(), "body", body);
    return Json::print(frame.get());
}

std::string encode_tombstone(const std::string& key, const std::string& revision)
{
    Json::Ptr frame = Json::object();
    Json::set_string(frame.get(), "key", key);
    Json::set_string(frame.get(), "rev", revision);
    Json::set_bool(frame.get(), "deleted", true);
    return Json::print(frame.get());
}

std::string next_revision(const std::optional<std::string>& previous)
{
    std::uint64_t generation = previous ? revision_generation(*previous) + 1 : 1;
    return std::to_string(generation) + "-" + infra::IdGenerator::random_hex(16);
}

} // namespace

LogEngine::LogEngine(LogEngineOptions options) : options_(std::move(options)) {}

std::string LogEngine::path() const
{
    return options_.base_path + "/" + options_.name + ".aev";
}

void LogEngine::open()
{
    std::error_code ec;
    fs::create_directories(options_.base_path, ec);
    if (ec || !fs::is_directory(options_.base_path)) {
        throw StoreError(ErrorCode::ENGINE_FAILURE,
                         "Cannot create data directory '" + options_.base_path +
                             "': " + (ec ? ec.message() : "not a directory"));
    }

    records_.clear();
    update_seq_ = 0;
    frame_count_ = 0;
    log_bytes_ = 0;

    replay();

    // Check writability now rather than on the first put.
    std::ofstream touch(path(), std::ios::binary | std::ios::app);
    if (!touch.is_open()) {
        throw StoreError(ErrorCode::ENGINE_FAILURE, "Log file '" + path() + "' is not writable");
    }
    touch.close();

    opened_ = true;
    maybe_compact();

    Logger::log(LogLevel::DEBUG, "LogEngine: Opened '" + path() + "' with " +
                                     std::to_string(records_.size()) + " documents.");
}

/**
 * @brief Rebuilds the index from the log.
 *
 * 1. **Header Read:** 4 bytes giving the payload size.
 * 2. **Body Read:** exactly that many bytes.
 * 3. **Apply:** live frames overwrite the index entry, tombstones erase it.
 *
 * A short header or body at the end of the file is a torn append: the file is
 * truncated back to the last complete frame. A complete frame that is not a
 * valid record means the database is corrupt and the open fails.
 */
void LogEngine::replay()
{
    std::ifstream file(path(), std::ios::binary);
    if (!file.is_open()) {
        return;
    }

    std::uint64_t good_offset = 0;
    bool torn = false;

    while (file.peek() != EOF) {
        uint32_t payload_length = 0;
        file.read(reinterpret_cast<char*>(&payload_length), sizeof(payload_length));
        if (file.gcount() < static_cast<std::streamsize>(sizeof(payload_length))) {
            torn = true;
            break;
        }

        std::string buffer;
        buffer.resize(payload_length);
        file.read(&buffer[0], payload_length);
        if (file.gcount() != static_cast<std::streamsize>(payload_length)) {
            torn = true;
            break;
        }

        Json::Ptr frame = Json::parse(buffer);
        std::string key = Json::get_string(frame.get(), "key");
        std::string revision = Json::get_string(frame.get(), "rev");
        if (!frame || key.empty() || revision.empty()) {
            throw StoreError(ErrorCode::ENGINE_FAILURE,
                             "Corrupted database '" + path() + "': unreadable frame at offset " +
                                 std::to_string(good_offset));
        }

        if (Json::get_bool(frame.get(), "deleted")) {
            records_.erase(key);
        } else {
            records_[key] = Record{revision, Json::get_string(frame.get(), "body")};
        }

        ++frame_count_;
        good_offset += sizeof(payload_length) + payload_length;
    }
    file.close();

    if (torn) {
        Logger::log(LogLevel::WARN, "LogEngine: Discarding torn frame at the end of '" + path() +
                                        "' (offset " + std::to_string(good_offset) + ").");
        std::error_code ec;
        fs::resize_file(path(), good_offset, ec);
        if (ec) {
            throw StoreError(ErrorCode::ENGINE_FAILURE,
                             "Cannot truncate torn log '" + path() + "': " + ec.message());
        }
    }

    log_bytes_ = good_offset;
}

void LogEngine::ensure_open() const
{
    if (!opened_) {
        throw StoreError(ErrorCode::UNAVAILABLE, "LogEngine used before open()");
    }
}

void LogEngine::append_frame(const std::string& raw)
{
    std::uint64_t frame_bytes = sizeof(uint32_t) + raw.size();

    if (options_.quota_bytes > 0 && log_bytes_ + frame_bytes > options_.quota_bytes) {
        // Reclaim dead frames before giving up.
        if (frame_count_ > records_.size()) {
            compact();
        }
        if (log_bytes_ + frame_bytes > options_.quota_bytes) {
            throw StoreError(ErrorCode::QUOTA_EXCEEDED,
                             "Storage quota of " + std::to_string(options_.quota_bytes) +
                                 " bytes exceeded");
        }
    }

    errno = 0;
    std::ofstream file(path(), std::ios::binary | std::ios::app);
    if (!file.is_open()) {
        throw StoreError(ErrorCode::ENGINE_FAILURE, "Cannot open log '" + path() + "' for append");
    }

    write_frame(file, raw);
    file.flush();

    if (!file.good()) {
        if (errno == ENOSPC || errno == EDQUOT) {
            throw StoreError(ErrorCode::QUOTA_EXCEEDED, "No space left for log '" + path() + "'");
        }
        throw StoreError(ErrorCode::ENGINE_FAILURE, "Write to log '" + path() + "' failed");
    }

    log_bytes_ += frame_bytes;
    ++frame_count_;
}

std::string LogEngine::put(const Document& doc)
{
    ensure_open();
    if (doc.key.empty()) {
        throw StoreError(ErrorCode::INVALID_ARGUMENT, "Document key must not be empty");
    }

    std::optional<std::string> stored;
    auto it = records_.find(doc.key);
    if (it != records_.end()) {
        stored = it->second.revision;
    }
    check_revision(doc.key, stored, doc.revision);

    std::string revision = next_revision(stored);
    append_frame(encode_live(doc.key, revision, doc.body));

    records_[doc.key] = Record{revision, doc.body};
    ++update_seq_;
    maybe_compact();
    return revision;
}

std::optional<Document> LogEngine::get(const std::string& key)
{
    ensure_open();
    auto it = records_.find(key);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return Document{key, it->second.revision, it->second.body};
}

std::vector<Document> LogEngine::all_docs(const KeyRange& range)
{
    ensure_open();
    std::vector<Document> docs;
    for (auto it = records_.lower_bound(range.start); it != records_.end(); ++it) {
        if (!range.contains(it->first)) {
            break;
        }
        docs.push_back(Document{it->first, it->second.revision, it->second.body});
    }
    return docs;
}

bool LogEngine::remove(const std::string& key, const std::string& revision)
{
    ensure_open();
    auto it = records_.find(key);
    if (it == records_.end()) {
        return false;
    }
    check_revision(key, it->second.revision, revision);

    append_frame(encode_tombstone(key, next_revision(it->second.revision)));
    records_.erase(it);
    ++update_seq_;
    maybe_compact();
    return true;
}

EngineInfo LogEngine::info()
{
    ensure_open();
    return EngineInfo{options_.name, "log", records_.size(), update_seq_, false};
}

void LogEngine::destroy()
{
    ensure_open();
    auto saved = std::move(records_);
    records_.clear();
    if (!compact()) {
        records_ = std::move(saved);
        throw StoreError(ErrorCode::ENGINE_FAILURE, "Cannot reset log '" + path() + "'");
    }
    ++update_seq_;
    Logger::log(LogLevel::INFO, "LogEngine: Destroyed all documents in '" + options_.name + "'.");
}

/**
 * @brief Atomic compaction.
 *
 * 1. **Snapshot:** live documents go to `<log>.tmp`.
 * 2. **Flush:** the temp file is closed and checked.
 * 3. **Atomic Swap:** `fs::rename` replaces the old log.
 */
bool LogEngine::compact()
{
    std::string temp_path = path() + ".tmp";

    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }

    std::uint64_t bytes = 0;
    for (const auto& [key, record] : records_) {
        std::string raw = encode_live(key, record.revision, record.body);
        write_frame(file, raw);
        bytes += sizeof(uint32_t) + raw.size();
    }

    file.flush();
    file.close();

    std::error_code ec;
    if (file.fail()) {
        fs::remove(temp_path, ec);
        return false;
    }

    fs::rename(temp_path, path(), ec);
    if (ec) {
        Logger::log(LogLevel::ERROR, "LogEngine: Compaction swap failed: " + ec.message());
        fs::remove(temp_path, ec);
        return false;
    }

    log_bytes_ = bytes;
    frame_count_ = records_.size();
    return true;
}

void LogEngine::maybe_compact()
{
    if (frame_count_ > kCompactionMinFrames && frame_count_ > records_.size() * kCompactionRatio) {
        if (compact()) {
            Logger::log(LogLevel::DEBUG, "LogEngine: Compacted '" + path() + "' to " +
                                             std::to_string(frame_count_) + " frames.");
        }
    }
}

} // namespace aula::storage
