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
 * @file flat_store.cpp
 * @brief Implementation of the flat key/value store.
 */

#include "aula/storage/flat_store.hpp"

#include "aula/infra/json.hpp"
#include "aula/infra/logger.hpp"
#include "aula/storage/errors.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace aula::storage {

using infra::Json;

FlatStore::FlatStore(std::string file_path, std::size_t quota_bytes)
    : file_path_(std::move(file_path)), quota_bytes_(quota_bytes)
{
}

void FlatStore::load()
{
    std::lock_guard<std::mutex> lock(mutex_);
    items_.clear();
    used_bytes_ = 0;

    if (file_path_.empty()) {
        return;
    }

    std::ifstream file(file_path_);
    if (!file.is_open()) {
        return;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    Json::Ptr root = Json::parse(buffer.str());
    if (!cJSON_IsObject(root.get())) {
        infra::Logger::log(infra::LogLevel::WARN,
                           "FlatStore: Ignoring unreadable file '" + file_path_ + "'.");
        return;
    }

    cJSON* item = nullptr;
    cJSON_ArrayForEach(item, root.get())
    {
        if (cJSON_IsString(item) && item->string && item->valuestring) {
            std::string key = item->string;
            std::string value = item->valuestring;
            used_bytes_ += key.size() + value.size();
            items_[key] = std::move(value);
        }
    }
}

/**
 * @brief Writes the whole map to `<path>.tmp` and renames it over `<path>`.
 *
 * @throws StoreError (`ENGINE_FAILURE`) if the file cannot be written.
 */
void FlatStore::persist_locked() const
{
    if (file_path_.empty()) {
        return;
    }

    Json::Ptr root = Json::object();
    for (const auto& [key, value] : items_) {
        Json::set_string(root.get(), key.c_str(), value);
    }
    std::string text = Json::print(root.get());

    std::string temp_path = file_path_ + ".tmp";
    std::ofstream file(temp_path, std::ios::trunc);
    if (!file.is_open()) {
        throw StoreError(ErrorCode::ENGINE_FAILURE,
                         "Cannot write flat store '" + file_path_ + "'");
    }
    file << text;
    file.flush();
    file.close();

    std::error_code ec;
    if (file.fail()) {
        fs::remove(temp_path, ec);
        throw StoreError(ErrorCode::ENGINE_FAILURE,
                         "Write to flat store '" + file_path_ + "' failed");
    }

    fs::rename(temp_path, file_path_, ec);
    if (ec) {
        fs::remove(temp_path, ec);
        throw StoreError(ErrorCode::ENGINE_FAILURE,
                         "Cannot replace flat store '" + file_path_ + "': " + ec.message());
    }
}

void FlatStore::set_item(const std::string& key, const std::string& value)
{
    std::lock_guard<std::mutex> lock(mutex_);

    std::optional<std::string> previous;
    auto it = items_.find(key);
    if (it != items_.end()) {
        previous = it->second;
    }

    std::size_t next_bytes = used_bytes_ + key.size() + value.size();
    if (previous) {
        next_bytes -= key.size() + previous->size();
    }
    if (quota_bytes_ > 0 && next_bytes > quota_bytes_) {
        throw StoreError(ErrorCode::QUOTA_EXCEEDED,
                         "Flat storage quota exceeded while setting '" + key + "'");
    }

    items_[key] = value;
    try {
        persist_locked();
    } catch (const StoreError&) {
        if (previous) {
            items_[key] = *previous;
        } else {
            items_.erase(key);
        }
        throw;
    }
    used_bytes_ = next_bytes;
}

std::optional<std::string> FlatStore::get_item(const std::string& key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = items_.find(key);
    if (it == items_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool FlatStore::remove_item(const std::string& key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = items_.find(key);
    if (it == items_.end()) {
        return false;
    }

    std::string previous = it->second;
    items_.erase(it);
    try {
        persist_locked();
    } catch (const StoreError&) {
        items_[key] = previous;
        throw;
    }
    used_bytes_ -= key.size() + previous.size();
    return true;
}

std::vector<std::string> FlatStore::keys_with_prefix(const std::string& prefix) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    for (auto it = items_.lower_bound(prefix); it != items_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        keys.push_back(it->first);
    }
    return keys;
}

void FlatStore::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, std::string> previous;
    previous.swap(items_);
    try {
        persist_locked();
    } catch (const StoreError&) {
        items_.swap(previous);
        throw;
    }
    used_bytes_ = 0;
}

std::size_t FlatStore::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

std::size_t FlatStore::used_bytes() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return used_bytes_;
}

} // namespace aula::storage
