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
 * @file sync_queue.cpp
 * @brief Implementation of the offline action queue.
 */

#include "aula/sync/sync_queue.hpp"

#include "aula/infra/clock.hpp"
#include "aula/infra/id_generator.hpp"
#include "aula/infra/logger.hpp"

#include <algorithm>
#include <unordered_set>

namespace aula::sync {

using infra::Json;

Json::Ptr SyncAction::payload() const
{
    Json::Ptr parsed = Json::parse(data);
    if (!cJSON_IsObject(parsed.get())) {
        return Json::object();
    }
    return parsed;
}

SyncQueue::SyncQueue(storage::FlatStore& flat) : flat_(flat) {}

std::vector<SyncAction> SyncQueue::load_locked() const
{
    std::vector<SyncAction> actions;
    std::optional<std::string> text = flat_.get_item(kSyncQueueKey);
    if (!text) {
        return actions;
    }

    Json::Ptr list = Json::parse(*text);
    if (!cJSON_IsArray(list.get())) {
        infra::Logger::log(infra::LogLevel::WARN, "Sync: Queue list is unreadable; ignoring it.");
        return actions;
    }

    const cJSON* item = nullptr;
    cJSON_ArrayForEach(item, list.get())
    {
        SyncAction action;
        action.id = Json::get_string(item, "id");
        action.type = Json::get_string(item, "type");
        const cJSON* data = cJSON_GetObjectItemCaseSensitive(item, "data");
        action.data = data ? Json::print(data) : "{}";
        action.timestamp = Json::get_string(item, "timestamp");
        action.user_id = Json::get_string(item, "userId");
        actions.push_back(std::move(action));
    }
    return actions;
}

void SyncQueue::store_locked(const std::vector<SyncAction>& actions)
{
    Json::Ptr list = Json::array();
    for (const auto& action : actions) {
        Json::Ptr item = Json::object();
        Json::set_string(item.get(), "id", action.id);
        Json::set_string(item.get(), "type", action.type);
        Json::set_item(item.get(), "data", action.payload());
        Json::set_string(item.get(), "timestamp", action.timestamp);
        Json::set_string(item.get(), "userId", action.user_id);
        Json::append(list.get(), std::move(item));
    }
    flat_.set_item(kSyncQueueKey, Json::print(list.get()));
}

SyncAction SyncQueue::enqueue(const std::string& type, const cJSON* data,
                              const std::string& user_id)
{
    SyncAction action;
    action.id = infra::IdGenerator::generate();
    action.type = type;
    action.data = cJSON_IsObject(data) ? Json::print(data) : "{}";
    action.timestamp = infra::Clock::now_iso8601();
    action.user_id = user_id;

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SyncAction> actions = load_locked();
    actions.push_back(action);
    store_locked(actions);

    infra::Logger::log(infra::LogLevel::INFO, "Sync: Queued '" + type + "' (" +
                                                  std::to_string(actions.size()) + " pending).");
    return action;
}

std::vector<SyncAction> SyncQueue::pending() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return load_locked();
}

std::size_t SyncQueue::size() const
{
    return pending().size();
}

std::size_t SyncQueue::remove(const std::vector<std::string>& ids)
{
    if (ids.empty()) {
        return 0;
    }
    std::unordered_set<std::string> doomed(ids.begin(), ids.end());

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SyncAction> actions = load_locked();
    std::size_t before = actions.size();
    actions.erase(std::remove_if(actions.begin(), actions.end(),
                                 [&](const SyncAction& a) { return doomed.count(a.id) > 0; }),
                  actions.end());
    std::size_t removed = before - actions.size();
    if (removed > 0) {
        store_locked(actions);
    }
    return removed;
}

void SyncQueue::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    flat_.remove_item(kSyncQueueKey);
}

} // namespace aula::sync
