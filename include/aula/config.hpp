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
 * @file config.hpp
 * @brief Runtime configuration of the offline client.
 *
 * @details
 * Values come from three layers, each overriding the previous one:
 * 1. Compiled-in defaults (the fields below).
 * 2. An optional JSON file (`Config::load`).
 * 3. Environment variables (`Config::apply_env`): `AULA_DATA_DIR`,
 *    `AULA_API_URL`, `AULA_LOG_LEVEL`.
 */

#pragma once

#include "aula/infra/logger.hpp"
#include "aula/sync/commit_policy.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace aula {

/**
 * @class ConfigError
 * @brief Raised for an unreadable or malformed configuration file.
 */
class ConfigError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

struct Config {
    // --- Local storage -----------------------------------------------------
    std::string data_dir = "./aula_data";
    std::string database_name = "aula_local";
    int init_max_attempts = 3;
    std::chrono::milliseconds init_backoff{1000};
    bool fallback_enabled = true;
    std::uint64_t storage_quota_bytes = 0;        ///< 0 = unlimited.
    std::size_t flat_quota_bytes = 5 * 1024 * 1024;

    // --- Sync ----------------------------------------------------------------
    std::chrono::milliseconds sync_interval{5 * 60 * 1000};
    std::chrono::milliseconds reconnect_delay{2000};
    sync::CommitPolicy commit_policy = sync::CommitPolicy::PER_ACTION;

    // --- Remote API ------------------------------------------------------------
    std::string api_base_url = "http://localhost:3000/api/v1";
    long api_timeout_ms = 10000;

    infra::LogLevel log_level = infra::LogLevel::INFO;

    /**
     * @brief Reads a JSON configuration file over the defaults.
     *
     * Recognized keys mirror the field names (`data_dir`, `sync_interval_ms`,
     * `init_backoff_ms`, `reconnect_delay_ms`, `commit_policy`, ...). Unknown
     * keys are ignored.
     *
     * @return Defaults when the file does not exist.
     * @throws ConfigError on malformed JSON or an invalid value.
     */
    static Config load(const std::string& path);

    /// @brief Applies `AULA_*` environment overrides in place.
    void apply_env();

    /// @brief Path of the flat key/value file inside `data_dir`.
    std::string flat_store_path() const;
};

} // namespace aula
