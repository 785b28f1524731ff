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
 * @file clock.cpp
 * @brief Implementation of the ISO-8601 helpers.
 */

#include "aula/infra/clock.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace aula::infra {

std::string Clock::now_iso8601()
{
    return format_iso8601(std::chrono::system_clock::now());
}

std::string Clock::format_iso8601(time_point tp)
{
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() %
        1000;
    if (millis < 0) {
        millis += 1000;
    }
    std::time_t seconds = std::chrono::system_clock::to_time_t(tp);

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
        << millis << 'Z';
    return out.str();
}

std::optional<Clock::time_point> Clock::parse_iso8601(const std::string& text)
{
    std::tm utc{};
    std::istringstream in(text);
    in >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return std::nullopt;
    }

    int millis = 0;
    if (in.peek() == '.') {
        in.get();
        std::string digits;
        while (std::isdigit(in.peek())) {
            digits.push_back(static_cast<char>(in.get()));
        }
        if (!digits.empty()) {
            digits.resize(3, '0');
            millis = std::stoi(digits);
        }
    }

    std::time_t seconds = timegm(&utc);
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(seconds) + std::chrono::milliseconds(millis);
}

std::int64_t Clock::epoch_millis()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace aula::infra
