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
 * @file http_remote_api.hpp
 * @brief libcurl implementation of `RemoteApi`.
 */

#pragma once

#include "aula/sync/remote_api.hpp"

#include <mutex>
#include <string>

namespace aula::sync {

/**
 * @class HttpRemoteApi
 * @brief Issues blocking JSON requests against the learning platform REST API.
 *
 * Endpoints, relative to `base_url`:
 * - `POST /courses/{courseId}/enroll`
 * - `POST /courses/{courseId}/quizzes/{quizId}/submit`
 * - `PUT  /users/progress/{courseId}`
 * - `PUT  /users/profile`
 *
 * One easy handle is created per request, so an instance may be shared
 * between threads.
 */
class HttpRemoteApi : public RemoteApi {
  public:
    /**
     * @param base_url   API root without a trailing slash, e.g. `http://host/api/v1`.
     * @param timeout_ms Whole-request timeout; 0 leaves libcurl's default.
     */
    HttpRemoteApi(std::string base_url, long timeout_ms);

    /// @brief Bearer token sent as `Authorization`; empty disables the header.
    void set_token(const std::string& token);

    ApiResponse enroll(const std::string& course_id) override;
    ApiResponse submit_quiz(const std::string& course_id, const std::string& quiz_id,
                            const cJSON* answers, double score,
                            std::int64_t time_spent) override;
    ApiResponse update_progress(const std::string& course_id, const std::string& lesson_id,
                                double progress, const std::string& last_accessed,
                                const cJSON* completed_lessons) override;
    ApiResponse update_profile(const cJSON* profile) override;

  private:
    /**
     * @throws NetworkError if the transfer itself fails.
     */
    ApiResponse request(const char* method, const std::string& path, const cJSON* body);

    std::string token() const;

    std::string base_url_;
    long timeout_ms_;
    mutable std::mutex token_mutex_;
    std::string token_;
};

/**
 * @brief Reads the `{success, data, error}` envelope of a response.
 *
 * `message` stands in for a missing `error`. A non-2xx status is never a
 * success; without an error text it reports `HTTP <status>`.
 */
ApiResponse parse_api_response(long status, const std::string& body);

} // namespace aula::sync
