/**
 * @file config.hpp
 * @brief Runtime settings for logging and host tracing
 */

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "logging.hpp"

namespace cellar {

struct Config {
    LogLevel log_level = LogLevel::INFO;
    bool log_timestamps = false;
    bool log_components = true;
    bool trace_storage = false;     // per-call DEBUG trace in MemoryStorage
    bool journal_storage = false;   // MemoryStorage write/clear journal

    /**
     * Reads known keys from a JSON object; unknown keys are ignored.
     * Throws std::runtime_error naming the key on a type mismatch.
     */
    static Config from_json(const nlohmann::json& j);

    /**
     * Parses the JSON file at `path`.
     */
    static Config from_file(const std::string& path);

    /**
     * Applies CELLAR_LOG_LEVEL, CELLAR_TRACE_STORAGE and
     * CELLAR_JOURNAL_STORAGE on top of `base`.
     */
    static Config from_env(Config base);
    static Config from_env();

    nlohmann::json to_json() const;

    /// Pushes the logging settings into the global Logger.
    void apply() const;
};

inline Config Config::from_env() { return from_env(Config{}); }

} // namespace cellar
