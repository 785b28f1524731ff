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
 * @file config.cpp
 * @brief Configuration loading.
 */

#include "aula/config.hpp"

#include "aula/infra/json.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace aula {

using infra::Json;

namespace {

std::chrono::milliseconds read_millis(const cJSON* root, const char* field,
                                      std::chrono::milliseconds fallback)
{
    if (!Json::has(root, field)) {
        return fallback;
    }
    std::int64_t value = Json::get_int(root, field, -1);
    if (value < 0) {
        throw ConfigError(std::string("Config: '") + field + "' must be a non-negative number");
    }
    return std::chrono::milliseconds(value);
}

} // namespace

Config Config::load(const std::string& path)
{
    Config config;

    if (!std::filesystem::exists(path)) {
        return config;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Config: cannot read '" + path + "'");
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    Json::Ptr root = Json::parse(buffer.str());
    if (!cJSON_IsObject(root.get())) {
        throw ConfigError("Config: '" + path + "' is not a JSON object");
    }
    const cJSON* r = root.get();

    config.data_dir = Json::get_string(r, "data_dir", config.data_dir);
    config.database_name = Json::get_string(r, "database_name", config.database_name);
    config.init_max_attempts =
        static_cast<int>(Json::get_int(r, "init_max_attempts", config.init_max_attempts));
    config.init_backoff = read_millis(r, "init_backoff_ms", config.init_backoff);
    config.fallback_enabled = Json::get_bool(r, "fallback_enabled", config.fallback_enabled);
    config.storage_quota_bytes = static_cast<std::uint64_t>(
        Json::get_int(r, "storage_quota_bytes", static_cast<std::int64_t>(config.storage_quota_bytes)));
    config.flat_quota_bytes = static_cast<std::size_t>(
        Json::get_int(r, "flat_quota_bytes", static_cast<std::int64_t>(config.flat_quota_bytes)));
    config.sync_interval = read_millis(r, "sync_interval_ms", config.sync_interval);
    config.reconnect_delay = read_millis(r, "reconnect_delay_ms", config.reconnect_delay);
    config.api_base_url = Json::get_string(r, "api_base_url", config.api_base_url);
    config.api_timeout_ms = static_cast<long>(Json::get_int(r, "api_timeout_ms", config.api_timeout_ms));

    if (config.init_max_attempts < 1) {
        throw ConfigError("Config: 'init_max_attempts' must be at least 1");
    }
    if (config.database_name.empty()) {
        throw ConfigError("Config: 'database_name' must not be empty");
    }

    if (Json::has(r, "commit_policy")) {
        std::string name = Json::get_string(r, "commit_policy");
        auto policy = sync::parse_commit_policy(name);
        if (!policy) {
            throw ConfigError("Config: unknown commit_policy '" + name + "'");
        }
        config.commit_policy = *policy;
    }

    if (Json::has(r, "log_level")) {
        config.log_level = infra::Logger::parse_level(Json::get_string(r, "log_level"),
                                                      config.log_level);
    }

    return config;
}

void Config::apply_env()
{
    if (const char* dir = std::getenv("AULA_DATA_DIR"); dir && *dir) {
        data_dir = dir;
    }
    if (const char* url = std::getenv("AULA_API_URL"); url && *url) {
        api_base_url = url;
    }
    if (const char* level = std::getenv("AULA_LOG_LEVEL"); level && *level) {
        log_level = infra::Logger::parse_level(level, log_level);
    }
}

std::string Config::flat_store_path() const
{
    return data_dir + "/flat_store.json";
}

} // namespace aula
