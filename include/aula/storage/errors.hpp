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
 * @file errors.hpp
 * @brief Error taxonomy of the local storage layer.
 *
 * @details
 * A missing document is never an error: lookups return `std::nullopt`.
 * Every other storage failure is raised as a `StoreError` and travels to the
 * caller untouched; the cache and ledger layers add no wrapping of their own.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace aula::storage {

/**
 * @enum ErrorCode
 * @brief Classification of storage failures.
 */
enum class ErrorCode {
    CONFLICT,         ///< Revision mismatch on write. Re-read and retry; never auto-merge.
    QUOTA_EXCEEDED,   ///< Storage full. Requires user action (clear data).
    ENGINE_FAILURE,   ///< The engine could not open, read or write its backing store.
    UNAVAILABLE,      ///< No engine can serve requests ("offline data unavailable").
    INVALID_ARGUMENT  ///< Malformed request (empty key, bad range).
};

/// @brief Stable lowercase name for an error code (`"conflict"`, `"quota_exceeded"`, ...).
const char* to_string(ErrorCode code);

/**
 * @class StoreError
 * @brief Exception raised by storage engines, the document store and the flat mirror.
 */
class StoreError : public std::runtime_error {
  public:
    StoreError(ErrorCode code, const std::string& message);

    ErrorCode code() const noexcept { return code_; }

    /**
     * @brief True when the failure means the backing store cannot be used at all.
     *
     * Read paths treat this as a signal to consult the flat mirror instead.
     */
    bool is_unavailable() const noexcept
    {
        return code_ == ErrorCode::ENGINE_FAILURE || code_ == ErrorCode::UNAVAILABLE;
    }

  private:
    ErrorCode code_;
};

} // namespace aula::storage
