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
 * @file connectivity.hpp
 * @brief Online/offline signal with transition listeners.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace aula::offline {

/**
 * @class ConnectivityMonitor
 * @brief Holds the platform's connectivity signal.
 *
 * @details
 * The platform layer feeds `set_online()`; consumers read `is_online()`.
 * The value is advisory: local writes never wait on it. Listeners fire on
 * transitions only, on the thread that called `set_online()`, outside the
 * internal lock.
 */
class ConnectivityMonitor {
  public:
    using Listener = std::function<void(bool online)>;
    using ListenerId = std::uint64_t;

    explicit ConnectivityMonitor(bool initially_online = true);

    bool is_online() const { return online_.load(); }

    void set_online(bool online);

    ListenerId subscribe(Listener listener);

    /// @return false if the id was not registered.
    bool unsubscribe(ListenerId id);

  private:
    std::atomic<bool> online_;
    std::mutex mutex_;
    std::map<ListenerId, Listener> listeners_;
    ListenerId next_id_ = 1;
};

} // namespace aula::offline
