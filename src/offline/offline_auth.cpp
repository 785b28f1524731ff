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
 * @file offline_auth.cpp
 * @brief Implementation of offline authentication.
 */

#include "aula/offline/offline_auth.hpp"

#include "aula/infra/clock.hpp"
#include "aula/infra/logger.hpp"
#include "aula/infra/string.hpp"
#include "aula/storage/errors.hpp"

namespace aula::offline {

using infra::String;

namespace {

constexpr const char* kNoCachedUser =
    "No cached user found. Please login online first to enable offline access.";

} // namespace

OfflineAuthenticator::OfflineAuthenticator(cache::EntityCache& entities, storage::FlatStore& flat)
    : entities_(entities), flat_(flat)
{
}

AuthResult OfflineAuthenticator::authenticate_offline(const std::string& email,
                                                      const std::string& /*password*/)
{
    AuthResult result;
    const std::string wanted = String::trim(email);

    if (wanted.empty()) {
        result.message = kNoCachedUser;
        return result;
    }

    infra::Logger::log(infra::LogLevel::INFO, "Offline: Authenticating " + wanted);

    try {
        std::optional<cache::User> match = entities_.shadow_user();
        if (!match || !String::iequals(match->email, wanted)) {
            match.reset();

            std::vector<cache::User> users;
            try {
                users = entities_.get_all_cached_users();
            } catch (const storage::StoreError& e) {
                if (!e.is_unavailable()) {
                    throw;
                }
            }
            for (auto& user : users) {
                if (String::iequals(user.email, wanted)) {
                    match = std::move(user);
                    break;
                }
            }

            if (!match) {
                result.message = kNoCachedUser;
                infra::Logger::log(infra::LogLevel::WARN, "Offline: No cached identity for " + wanted);
                return result;
            }

            entities_.write_identity_shadow(*match);
        }

        flat_.set_item(kOfflineLoginTimeKey, infra::Clock::now_iso8601());

        result.success = true;
        result.user = match;
        result.message = "Offline login successful";
        infra::Logger::log(infra::LogLevel::INFO, "Offline: Login accepted for " + match->name);
    } catch (const storage::StoreError& e) {
        result = AuthResult{};
        result.message = "Offline authentication failed. Please try again.";
        infra::Logger::log(infra::LogLevel::ERROR,
                           std::string("Offline: Authentication failed: ") + e.what());
    }
    return result;
}

std::optional<std::string> OfflineAuthenticator::last_offline_login() const
{
    return flat_.get_item(kOfflineLoginTimeKey);
}

} // namespace aula::offline
