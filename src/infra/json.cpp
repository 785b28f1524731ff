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
 * @file json.cpp
 * @brief Implementation of the cJSON helpers.
 */

#include "aula/infra/json.hpp"

#include <cmath>

namespace aula::infra {

namespace {

void replace_or_add(cJSON* obj, const char* field, cJSON* item)
{
    if (cJSON_GetObjectItemCaseSensitive(obj, field)) {
        cJSON_ReplaceItemInObjectCaseSensitive(obj, field, item);
    } else {
        cJSON_AddItemToObject(obj, field, item);
    }
}

} // namespace

Json::Ptr Json::parse(const std::string& text)
{
    return Ptr(cJSON_Parse(text.c_str()));
}

Json::Ptr Json::object()
{
    return Ptr(cJSON_CreateObject());
}

Json::Ptr Json::array()
{
    return Ptr(cJSON_CreateArray());
}

Json::Ptr Json::clone(const cJSON* node)
{
    if (!node)
        return Ptr(cJSON_CreateNull());
    return Ptr(cJSON_Duplicate(node, 1));
}

std::string Json::print(const cJSON* node)
{
    if (!node)
        return "null";
    char* raw = cJSON_PrintUnformatted(node);
    if (!raw)
        return "null";
    std::string out(raw);
    cJSON_free(raw);
    return out;
}

bool Json::has(const cJSON* obj, const char* field)
{
    return obj && cJSON_GetObjectItemCaseSensitive(obj, field) != nullptr;
}

std::string Json::get_string(const cJSON* obj, const char* field, const std::string& fallback)
{
    const cJSON* node = obj ? cJSON_GetObjectItemCaseSensitive(obj, field) : nullptr;
    if (cJSON_IsString(node) && node->valuestring)
        return node->valuestring;
    return fallback;
}

std::optional<std::string> Json::get_optional_string(const cJSON* obj, const char* field)
{
    const cJSON* node = obj ? cJSON_GetObjectItemCaseSensitive(obj, field) : nullptr;
    if (cJSON_IsString(node) && node->valuestring)
        return std::string(node->valuestring);
    return std::nullopt;
}

double Json::get_number(const cJSON* obj, const char* field, double fallback)
{
    const cJSON* node = obj ? cJSON_GetObjectItemCaseSensitive(obj, field) : nullptr;
    if (cJSON_IsNumber(node))
        return node->valuedouble;
    return fallback;
}

std::int64_t Json::get_int(const cJSON* obj, const char* field, std::int64_t fallback)
{
    const cJSON* node = obj ? cJSON_GetObjectItemCaseSensitive(obj, field) : nullptr;
    if (cJSON_IsNumber(node))
        return static_cast<std::int64_t>(std::llround(node->valuedouble));
    return fallback;
}

bool Json::get_bool(const cJSON* obj, const char* field, bool fallback)
{
    const cJSON* node = obj ? cJSON_GetObjectItemCaseSensitive(obj, field) : nullptr;
    if (cJSON_IsBool(node))
        return cJSON_IsTrue(node);
    return fallback;
}

std::vector<std::string> Json::get_string_array(const cJSON* obj, const char* field)
{
    std::vector<std::string> out;
    const cJSON* arr = obj ? cJSON_GetObjectItemCaseSensitive(obj, field) : nullptr;
    if (!cJSON_IsArray(arr))
        return out;

    const cJSON* item = nullptr;
    cJSON_ArrayForEach(item, arr)
    {
        if (cJSON_IsString(item) && item->valuestring)
            out.emplace_back(item->valuestring);
    }
    return out;
}

const cJSON* Json::child(const cJSON* obj, const char* field)
{
    const cJSON* node = obj ? cJSON_GetObjectItemCaseSensitive(obj, field) : nullptr;
    if (cJSON_IsObject(node) || cJSON_IsArray(node))
        return node;
    return nullptr;
}

void Json::set_string(cJSON* obj, const char* field, const std::string& value)
{
    replace_or_add(obj, field, cJSON_CreateString(value.c_str()));
}

void Json::set_number(cJSON* obj, const char* field, double value)
{
    replace_or_add(obj, field, cJSON_CreateNumber(value));
}

void Json::set_bool(cJSON* obj, const char* field, bool value)
{
    replace_or_add(obj, field, cJSON_CreateBool(value ? 1 : 0));
}

void Json::set_null(cJSON* obj, const char* field)
{
    replace_or_add(obj, field, cJSON_CreateNull());
}

void Json::set_string_array(cJSON* obj, const char* field, const std::vector<std::string>& values)
{
    cJSON* arr = cJSON_CreateArray();
    for (const auto& value : values) {
        cJSON_AddItemToArray(arr, cJSON_CreateString(value.c_str()));
    }
    replace_or_add(obj, field, arr);
}

void Json::set_item(cJSON* obj, const char* field, Ptr item)
{
    replace_or_add(obj, field, item.release());
}

void Json::append(cJSON* arr, Ptr item)
{
    cJSON_AddItemToArray(arr, item.release());
}

} // namespace aula::infra
