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
 * @file connectivity.cpp
 * @brief Implementation of the connectivity monitor.
 */

#include "aula/offline/connectivity.hpp"

#include "aula/infra/logger.hpp"

#include <vector>

namespace aula::offline {

ConnectivityMonitor::ConnectivityMonitor(bool initially_online) : online_(initially_online) {}

void ConnectivityMonitor::set_online(bool online)
{
    if (online_.exchange(online) == online) {
        return;
    }

    infra::Logger::log(infra::LogLevel::INFO,
                       online ? "Offline: Connection restored." : "Offline: Connection lost.");

    std::vector<Listener> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, listener] : listeners_) {
            snapshot.push_back(listener);
        }
    }
    for (const auto& listener : snapshot) {
        listener(online);
    }
}

ConnectivityMonitor::ListenerId ConnectivityMonitor::subscribe(Listener listener)
{
    std::lock_guard<std::mutex> lock(mutex_);
    ListenerId id = next_id_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

bool ConnectivityMonitor::unsubscribe(ListenerId id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.erase(id) > 0;
}

} // namespace aula::offline
