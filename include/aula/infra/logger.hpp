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
 * @file logger.hpp
 * @brief Process-wide diagnostic logging for the Aula offline core.
 *
 * @details
 * Every subsystem (document store, entity cache, progress ledger, sync engine)
 * reports through this single static facility. Output is serialized by a mutex
 * so that messages emitted from the scheduler thread and the caller thread never
 * interleave on the console.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace aula::infra {

/**
 * @enum LogLevel
 * @brief Severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Per-document tracing (individual puts, scans).
    DEBUG, ///< State transitions useful while troubleshooting.
    INFO,  ///< Lifecycle events (engine ready, sync completed).
    WARN,  ///< Degraded operation (fallback engine, mirror write failed).
    ERROR, ///< Operation failures that were reported to the caller.
    FATAL  ///< Unrecoverable conditions.
};

/**
 * @class Logger
 * @brief Static, thread-safe console logger with a runtime severity threshold.
 *
 * @details
 * Messages below the configured threshold are discarded before formatting.
 * `TRACE`, `DEBUG` and `INFO` go to `std::cout`; `WARN` and above go to
 * `std::cerr`.
 *
 * @code
 * aula::infra::Logger::set_level(aula::infra::LogLevel::DEBUG);
 * aula::infra::Logger::log(aula::infra::LogLevel::WARN, "Store: Falling back to memory engine.");
 * @endcode
 */
class Logger {
  public:
    /**
     * @brief Writes a timestamped, severity-tagged message.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that will be emitted.
     */
    static void set_level(LogLevel level);

    /// @brief Returns the active minimum severity.
    static LogLevel level();

    /**
     * @brief Parses a textual level ("trace", "debug", "info", "warn", "error", "fatal").
     *
     * @param name Case-insensitive level name.
     * @param fallback Value returned when the name is not recognized.
     */
    static LogLevel parse_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

  private:
    /// @brief Guards the standard streams.
    static std::mutex mutex_;

    /// @brief Current threshold; read without the lock on the fast path.
    static std::atomic<LogLevel> threshold_;
};

} // namespace aula::infra
