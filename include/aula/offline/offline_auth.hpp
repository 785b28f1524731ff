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
 * @file offline_auth.hpp
 * @brief Degraded login against the identity cached by the last online login.
 *
 * @warning No password is verified. Offline login trusts the identity cached
 * on this device and matches the e-mail address only (case-insensitive). It is
 * a single-device convenience and must never replace a real credential check.
 */

#pragma once

#include "aula/cache/entity_cache.hpp"
#include "aula/storage/flat_store.hpp"

#include <optional>
#include <string>

namespace aula::offline {

/// @brief Flat key stamped on each successful offline login.
inline constexpr const char* kOfflineLoginTimeKey = "offlineLoginTime";

struct AuthResult {
    bool success = false;
    std::optional<cache::User> user;
    std::string message;
};

class OfflineAuthenticator {
  public:
    OfflineAuthenticator(cache::EntityCache& entities, storage::FlatStore& flat);

    /**
     * @brief Matches `email` against the identity shadow, then the cached users.
     *
     * On success records `offlineLoginTime` and points the identity shadow at
     * the matched user. Never throws for a missing identity.
     *
     * @param password Accepted for interface parity; ignored.
     */
    AuthResult authenticate_offline(const std::string& email, const std::string& password);

    std::optional<std::string> last_offline_login() const;

  private:
    cache::EntityCache& entities_;
    storage::FlatStore& flat_;
};

} // namespace aula::offline
