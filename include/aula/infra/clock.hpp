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
 * @file clock.hpp
 * @brief Wall-clock helpers for document bookkeeping fields.
 *
 * @details
 * `cachedAt`, `lastUpdated` and `lastActivity` are stored as ISO-8601 UTC
 * strings with millisecond precision (`2026-02-01T09:30:00.125Z`). Strings of
 * this fixed shape sort lexicographically in chronological order, which the
 * progress aggregation relies on when taking the latest activity.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace aula::infra {

class Clock {
  public:
    using time_point = std::chrono::system_clock::time_point;

    /// @brief Current UTC time as ISO-8601 with milliseconds.
    static std::string now_iso8601();

    /// @brief Formats a time point as ISO-8601 UTC with milliseconds.
    static std::string format_iso8601(time_point tp);

    /**
     * @brief Parses `YYYY-MM-DDTHH:MM:SS[.mmm]Z`.
     *
     * @return The time point, or `std::nullopt` for malformed input.
     */
    static std::optional<time_point> parse_iso8601(const std::string& text);

    /// @brief Milliseconds since the Unix epoch.
    static std::int64_t epoch_millis();
};

} // namespace aula::infra
