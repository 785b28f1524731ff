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
 * @file fake_remote_api.hpp
 * @brief Scriptable in-process server used by the sync and client tests.
 */

#pragma once

#include "aula/sync/remote_api.hpp"

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace aula::test {

/**
 * @class FakeRemoteApi
 * @brief Records every call as `"<endpoint>:<key>"` and answers through `respond`.
 *
 * By default every call succeeds. Calls may arrive from the scheduler thread.
 */
class FakeRemoteApi : public sync::RemoteApi {
  public:
    /// @brief Decides the answer for a recorded call; may throw `sync::NetworkError`.
    std::function<sync::ApiResponse(const std::string& call)> respond;

    sync::ApiResponse enroll(const std::string& course_id) override
    {
        return answer("enroll:" + course_id);
    }

    sync::ApiResponse submit_quiz(const std::string& course_id, const std::string& quiz_id,
                                  const cJSON* /*answers*/, double /*score*/,
                                  std::int64_t /*time_spent*/) override
    {
        return answer("quiz:" + course_id + "/" + quiz_id);
    }

    sync::ApiResponse update_progress(const std::string& course_id, const std::string& lesson_id,
                                      double progress, const std::string& /*last_accessed*/,
                                      const cJSON* /*completed_lessons*/) override
    {
        return answer("progress:" + course_id + "/" + lesson_id + "@" +
                      std::to_string(static_cast<int>(progress)));
    }

    sync::ApiResponse update_profile(const cJSON* profile) override
    {
        return answer("profile:" + infra::Json::get_string(profile, "name"));
    }

    std::vector<std::string> calls() const
    {
        std::lock_guard lock(mutex_);
        return calls_;
    }

  private:
    sync::ApiResponse answer(const std::string& call)
    {
        {
            std::lock_guard lock(mutex_);
            calls_.push_back(call);
        }
        if (respond) {
            return respond(call);
        }
        sync::ApiResponse ok;
        ok.success = true;
        ok.status = 200;
        return ok;
    }

    mutable std::mutex mutex_;
    std::vector<std::string> calls_;
};

/// @brief Failed envelope, as a server answers a rejected request.
inline sync::ApiResponse rejected(const std::string& error)
{
    sync::ApiResponse response;
    response.success = false;
    response.status = 400;
    response.error = error;
    return response;
}

inline sync::ApiResponse accepted()
{
    sync::ApiResponse response;
    response.success = true;
    response.status = 200;
    return response;
}

} // namespace aula::test
