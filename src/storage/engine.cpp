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
 * @file engine.cpp
 * @brief Revision rules shared by every storage engine.
 */

#include "aula/storage/engine.hpp"

#include "aula/storage/errors.hpp"

#include <cctype>

namespace aula::storage {

void check_revision(const std::string& key, const std::optional<std::string>& stored,
                    const std::optional<std::string>& supplied)
{
    if (stored) {
        if (!supplied) {
            throw StoreError(ErrorCode::CONFLICT,
                             "Document update conflict: '" + key + "' exists, revision required");
        }
        if (*supplied != *stored) {
            throw StoreError(ErrorCode::CONFLICT, "Document update conflict: '" + key +
                                                      "' is at " + *stored + ", not " + *supplied);
        }
        return;
    }

    if (supplied) {
        throw StoreError(ErrorCode::CONFLICT,
                         "Document update conflict: '" + key + "' does not exist");
    }
}

std::uint64_t revision_generation(const std::string& revision)
{
    std::uint64_t generation = 0;
    size_t i = 0;
    for (; i < revision.size() && std::isdigit(static_cast<unsigned char>(revision[i])); ++i) {
        generation = generation * 10 + static_cast<std::uint64_t>(revision[i] - '0');
    }
    if (i == 0 || i >= revision.size() || revision[i] != '-') {
        return 0;
    }
    return generation;
}

} // namespace aula::storage
