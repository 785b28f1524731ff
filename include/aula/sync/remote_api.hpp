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
 * @file remote_api.hpp
 * @brief Remote collaborator consumed by the replay engine.
 *
 * @details
 * Every call answers with the server's `{success, data, error}` envelope.
 * A call that never reached the server (DNS, refused connection, timeout)
 * throws `NetworkError` instead of returning a failed response.
 */

#pragma once

#include "aula/infra/json.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace aula::sync {

/// @brief Transport-level failure of a remote call.
class NetworkError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

struct ApiResponse {
    bool success = false;
    infra::Json::Ptr data; ///< Envelope `data`, may be empty.
    std::string error;
    long status = 0; ///< HTTP status; 0 for non-HTTP collaborators.
};

/**
 * @class RemoteApi
 * @brief Abstract server endpoints used to apply queued actions.
 */
class RemoteApi {
  public:
    virtual ~RemoteApi() = default;

    virtual ApiResponse enroll(const std::string& course_id) = 0;

    virtual ApiResponse submit_quiz(const std::string& course_id, const std::string& quiz_id,
                                    const cJSON* answers, double score,
                                    std::int64_t time_spent) = 0;

    /**
     * @param completed_lessons JSON array of lesson ids; may be null.
     */
    virtual ApiResponse update_progress(const std::string& course_id, const std::string& lesson_id,
                                        double progress, const std::string& last_accessed,
                                        const cJSON* completed_lessons) = 0;

    virtual ApiResponse update_profile(const cJSON* profile) = 0;
};

} // namespace aula::sync
