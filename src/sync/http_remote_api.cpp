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
 * @file http_remote_api.cpp
 * @brief libcurl transport for the remote API.
 */

#include "aula/sync/http_remote_api.hpp"

#include "aula/infra/logger.hpp"

#include <curl/curl.h>
#include <sstream>
#include <utility>

namespace aula::sync {

using infra::Json;

namespace {

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    auto* stream = static_cast<std::ostringstream*>(userdata);
    size_t count = size * nmemb;
    stream->write(ptr, static_cast<std::streamsize>(count));
    return count;
}

bool ensure_curl_global_init()
{
    static std::once_flag init_flag;
    static bool init_ok = false;
    std::call_once(init_flag, []() { init_ok = (curl_global_init(CURL_GLOBAL_ALL) == CURLE_OK); });
    return init_ok;
}

/// @brief Percent-encodes one path segment.
std::string escape_segment(CURL* handle, const std::string& segment)
{
    char* escaped = curl_easy_escape(handle, segment.c_str(), static_cast<int>(segment.size()));
    if (!escaped) {
        return segment;
    }
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

/// @brief Owns an easy handle and its header list for one request.
struct CurlRequest {
    CURL* handle = curl_easy_init();
    curl_slist* headers = nullptr;

    ~CurlRequest()
    {
        if (headers) {
            curl_slist_free_all(headers);
        }
        if (handle) {
            curl_easy_cleanup(handle);
        }
    }
};

std::string segment(const std::string& raw)
{
    CurlRequest scratch;
    if (!scratch.handle) {
        return raw;
    }
    return escape_segment(scratch.handle, raw);
}

} // namespace

HttpRemoteApi::HttpRemoteApi(std::string base_url, long timeout_ms)
    : base_url_(std::move(base_url)), timeout_ms_(timeout_ms)
{
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

void HttpRemoteApi::set_token(const std::string& token)
{
    std::lock_guard lock(token_mutex_);
    token_ = token;
}

std::string HttpRemoteApi::token() const
{
    std::lock_guard lock(token_mutex_);
    return token_;
}

ApiResponse HttpRemoteApi::enroll(const std::string& course_id)
{
    return request("POST", "/courses/" + segment(course_id) + "/enroll", nullptr);
}

ApiResponse HttpRemoteApi::submit_quiz(const std::string& course_id, const std::string& quiz_id,
                                       const cJSON* answers, double score,
                                       std::int64_t time_spent)
{
    Json::Ptr body = Json::object();
    Json::set_item(body.get(), "answers", answers ? Json::clone(answers) : Json::array());
    Json::set_number(body.get(), "score", score);
    Json::set_number(body.get(), "timeSpent", static_cast<double>(time_spent));
    return request("POST",
                   "/courses/" + segment(course_id) + "/quizzes/" + segment(quiz_id) + "/submit",
                   body.get());
}

ApiResponse HttpRemoteApi::update_progress(const std::string& course_id,
                                           const std::string& lesson_id, double progress,
                                           const std::string& last_accessed,
                                           const cJSON* completed_lessons)
{
    Json::Ptr body = Json::object();
    Json::set_string(body.get(), "lessonId", lesson_id);
    Json::set_number(body.get(), "progress", progress);
    Json::set_string(body.get(), "lastAccessed", last_accessed);
    Json::set_item(body.get(), "completedLessons",
                   completed_lessons ? Json::clone(completed_lessons) : Json::array());
    return request("PUT", "/users/progress/" + segment(course_id), body.get());
}

ApiResponse HttpRemoteApi::update_profile(const cJSON* profile)
{
    return request("PUT", "/users/profile", profile);
}

ApiResponse HttpRemoteApi::request(const char* method, const std::string& path,
                                   const cJSON* body)
{
    if (!ensure_curl_global_init()) {
        throw NetworkError("curl global initialization failed");
    }

    CurlRequest req;
    if (!req.handle) {
        throw NetworkError("curl_easy_init failed");
    }

    const std::string url = base_url_ + path;
    const std::string payload = body ? Json::print(body) : "{}";
    std::ostringstream response_stream;

    req.headers = curl_slist_append(req.headers, "Content-Type: application/json");
    req.headers = curl_slist_append(req.headers, "Accept: application/json");
    std::string bearer = token();
    if (!bearer.empty()) {
        std::string auth = "Authorization: Bearer " + bearer;
        req.headers = curl_slist_append(req.headers, auth.c_str());
    }

    curl_easy_setopt(req.handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(req.handle, CURLOPT_CUSTOMREQUEST, method);
    curl_easy_setopt(req.handle, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(req.handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(req.handle, CURLOPT_HTTPHEADER, req.headers);
    curl_easy_setopt(req.handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(req.handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(req.handle, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(req.handle, CURLOPT_WRITEDATA, &response_stream);
    if (timeout_ms_ > 0) {
        curl_easy_setopt(req.handle, CURLOPT_TIMEOUT_MS, timeout_ms_);
        curl_easy_setopt(req.handle, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms_);
    }

    infra::Logger::log(infra::LogLevel::DEBUG, std::string("Sync: ") + method + " " + url);

    CURLcode rc = curl_easy_perform(req.handle);
    if (rc != CURLE_OK) {
        throw NetworkError(std::string(method) + " " + url + " failed: " + curl_easy_strerror(rc));
    }

    long status = 0;
    curl_easy_getinfo(req.handle, CURLINFO_RESPONSE_CODE, &status);
    return parse_api_response(status, response_stream.str());
}

ApiResponse parse_api_response(long status, const std::string& body)
{
    ApiResponse response;
    response.status = status;
    const bool http_ok = status >= 200 && status < 300;

    Json::Ptr envelope = Json::parse(body);
    if (cJSON_IsObject(envelope.get())) {
        response.success = http_ok && Json::get_bool(envelope.get(), "success");
        response.error = Json::get_string(envelope.get(), "error",
                                          Json::get_string(envelope.get(), "message"));
        if (const cJSON* data = cJSON_GetObjectItemCaseSensitive(envelope.get(), "data")) {
            response.data = Json::clone(data);
        }
    } else if (http_ok) {
        response.error = "Unreadable response body";
    }

    if (!http_ok && response.error.empty()) {
        response.error = "HTTP " + std::to_string(status);
    }
    return response;
}

} // namespace aula::sync
