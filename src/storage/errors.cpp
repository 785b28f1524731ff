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
 * @file errors.cpp
 * @brief Storage error names.
 */

#include "aula/storage/errors.hpp"

namespace aula::storage {

const char* to_string(ErrorCode code)
{
    switch (code) {
    case ErrorCode::CONFLICT:
        return "conflict";
    case ErrorCode::QUOTA_EXCEEDED:
        return "quota_exceeded";
    case ErrorCode::ENGINE_FAILURE:
        return "engine_failure";
    case ErrorCode::UNAVAILABLE:
        return "unavailable";
    case ErrorCode::INVALID_ARGUMENT:
        return "invalid_argument";
    }
    return "unknown";
}

StoreError::StoreError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code)
{
}

} // namespace aula::storage
