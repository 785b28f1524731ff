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
 * @file id_generator.hpp
 * @brief Random identifiers for sync queue items and document revisions.
 */

#pragma once

#include <cstddef>
#include <string>

namespace aula::infra {

/**
 * @class IdGenerator
 * @brief Produces random identifiers from a per-thread Mersenne Twister.
 *
 * @details
 * Two shapes are needed by the offline core:
 * - **Queue item ids**: RFC 4122 Version 4 UUIDs
 *   (`xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx`), so replayed actions can be
 *   addressed individually when they are confirmed.
 * - **Revision suffixes**: opaque lowercase hex tokens appended to the
 *   generation counter of the primary engine (`3-9f2c...`).
 */
class IdGenerator {
  public:
    /// @brief Returns a canonical 36-character Version 4 UUID.
    static std::string generate();

    /**
     * @brief Returns `length` random lowercase hexadecimal characters.
     */
    static std::string random_hex(std::size_t length);
};

} // namespace aula::infra
