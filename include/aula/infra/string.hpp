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
 * @file string.hpp
 * @brief Text helpers shared by key construction, config parsing and offline auth.
 */

#pragma once

#include <string>

namespace aula::infra {

/**
 * @class String
 * @brief Static container for stateless string operations.
 *
 * @details
 * All functions operate byte-wise on ASCII; multi-byte UTF-8 sequences pass
 * through unchanged. This is sufficient for e-mail comparison and document keys.
 */
class String {
  public:
    /**
     * @brief Strips leading and trailing whitespace.
     *
     * @code
     * aula::infra::String::trim("  learner@aula.dev \n"); // "learner@aula.dev"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /// @brief ASCII lower-casing.
    static std::string to_lower(const std::string& s);

    /**
     * @brief Case-insensitive equality, used to match cached e-mail addresses.
     */
    static bool iequals(const std::string& a, const std::string& b);

    /// @brief True when `s` begins with `prefix`.
    static bool starts_with(const std::string& s, const std::string& prefix);
};

} // namespace aula::infra
