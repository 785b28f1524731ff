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
 * @file json.hpp
 * @brief RAII ownership and typed field access for cJSON trees.
 *
 * @details
 * Document bodies, the flat mirror file, the sync queue list and the
 * configuration file are all cJSON trees. `Json::Ptr` owns a root node and
 * releases it with `cJSON_Delete`, so early returns and exceptions never leak
 * a tree. Accessors are lenient: a missing or mistyped field yields the
 * supplied fallback, matching how cached payloads from older releases are read.
 */

#pragma once

#include <cJSON.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace aula::infra {

class Json {
  public:
    /// @brief Releases a root cJSON node.
    struct Deleter {
        void operator()(cJSON* node) const { cJSON_Delete(node); }
    };

    /// @brief Owning handle for a cJSON tree.
    using Ptr = std::unique_ptr<cJSON, Deleter>;

    /// @brief Parses text; returns an empty handle on syntax errors.
    static Ptr parse(const std::string& text);

    static Ptr object();
    static Ptr array();

    /// @brief Deep copy of an arbitrary node.
    static Ptr clone(const cJSON* node);

    /// @brief Serializes without whitespace. A null node prints as `null`.
    static std::string print(const cJSON* node);

    // --- Readers -----------------------------------------------------------

    static bool has(const cJSON* obj, const char* field);
    static std::string get_string(const cJSON* obj, const char* field,
                                  const std::string& fallback = "");
    static std::optional<std::string> get_optional_string(const cJSON* obj, const char* field);
    static double get_number(const cJSON* obj, const char* field, double fallback = 0.0);
    static std::int64_t get_int(const cJSON* obj, const char* field, std::int64_t fallback = 0);
    static bool get_bool(const cJSON* obj, const char* field, bool fallback = false);
    static std::vector<std::string> get_string_array(const cJSON* obj, const char* field);

    /// @brief Borrowed pointer to a child object or array, or `nullptr`.
    static const cJSON* child(const cJSON* obj, const char* field);

    // --- Writers (replace existing fields) ----------------------------------

    static void set_string(cJSON* obj, const char* field, const std::string& value);
    static void set_number(cJSON* obj, const char* field, double value);
    static void set_bool(cJSON* obj, const char* field, bool value);
    static void set_null(cJSON* obj, const char* field);
    static void set_string_array(cJSON* obj, const char* field,
                                 const std::vector<std::string>& values);

    /// @brief Attaches `item` under `field`, taking ownership.
    static void set_item(cJSON* obj, const char* field, Ptr item);

    /// @brief Appends `item` to an array, taking ownership.
    static void append(cJSON* arr, Ptr item);
};

} // namespace aula::infra
