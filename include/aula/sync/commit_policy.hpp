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
 * @file commit_policy.hpp
 * @brief How a replay batch is committed back to the sync queue.
 */

#pragma once

#include <optional>
#include <string>

namespace aula::sync {

enum class CommitPolicy {
    /// Remove exactly the actions the server confirmed. Failed actions stay queued.
    PER_ACTION,

    /// Legacy batch rule: clear the whole queue if any action succeeded,
    /// keep it untouched if none did.
    CLEAR_ON_ANY_SUCCESS
};

inline const char* to_string(CommitPolicy policy)
{
    return policy == CommitPolicy::PER_ACTION ? "per_action" : "clear_on_any_success";
}

/// @brief Parses `"per_action"` / `"clear_on_any_success"`.
inline std::optional<CommitPolicy> parse_commit_policy(const std::string& name)
{
    if (name == "per_action")
        return CommitPolicy::PER_ACTION;
    if (name == "clear_on_any_success")
        return CommitPolicy::CLEAR_ON_ANY_SUCCESS;
    return std::nullopt;
}

} // namespace aula::sync
