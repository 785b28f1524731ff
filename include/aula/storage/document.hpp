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
 * @file document.hpp
 * @brief Value types exchanged with storage engines.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace aula::storage {

/**
 * @struct Document
 * @brief A revisioned key/body pair.
 *
 * @details
 * `body` is the serialized JSON envelope written by the entity layer
 * (`type`, `payload`, `cachedAt`, `lastUpdated`). Engines treat it as opaque.
 *
 * `revision` is required when replacing an existing document and must be
 * absent when creating one. Engines fill it in on documents they return.
 */
struct Document {
    std::string key;
    std::optional<std::string> revision;
    std::string body;
};

/**
 * @struct KeyRange
 * @brief Half-open key interval `[start, end)` over the key-sorted store.
 *
 * An empty `end` means "to the last key".
 */
struct KeyRange {
    std::string start;
    std::string end;

    /// @brief Every key in the store.
    static KeyRange all() { return KeyRange{}; }

    /**
     * @brief Every key starting with `prefix`: `[prefix, successor(prefix))`.
     *
     * The end is the prefix with its last byte incremented, trailing `0xFF`
     * bytes dropped first. Keys compare as unsigned bytes, so every
     * continuation of the prefix, multi-byte UTF-8 included, is inside.
     */
    static KeyRange prefix(const std::string& prefix)
    {
        std::string end = prefix;
        while (!end.empty() && static_cast<unsigned char>(end.back()) == 0xFF) {
            end.pop_back();
        }
        if (!end.empty()) {
            end.back() = static_cast<char>(static_cast<unsigned char>(end.back()) + 1);
        }
        return KeyRange{prefix, end};
    }

    bool contains(const std::string& key) const
    {
        return key >= start && (end.empty() || key < end);
    }
};

/**
 * @struct EngineInfo
 * @brief Result of the `info()` self-test call.
 */
struct EngineInfo {
    std::string name;            ///< Logical database name.
    std::string engine;          ///< Engine kind (`"log"`, `"memory"`).
    std::size_t document_count = 0;
    std::uint64_t update_seq = 0; ///< Number of committed writes since open.
    bool is_fallback = false;    ///< Diagnostics only; never branch on it.
};

} // namespace aula::storage
