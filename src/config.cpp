/**
 * @file config.cpp
 * @brief JSON and environment configuration
 */

#include "config.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace cellar {

namespace {

bool parse_flag(const std::string& value) {
    return value == "1" || value == "true" || value == "TRUE" || value == "on" || value == "yes";
}

template <typename T>
void read_field(const nlohmann::json& j, const char* name, T& out) {
    auto it = j.find(name);
    if (it == j.end()) {
        return;
    }
    try {
        out = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Invalid type for config key '") + name + "': " +
                                 e.what());
    }
}

} // namespace

Config Config::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Config must be a JSON object");
    }

    Config config;
    std::string level = log_level_to_string(config.log_level);
    read_field(j, "log_level", level);
    config.log_level = string_to_log_level(level);
    read_field(j, "log_timestamps", config.log_timestamps);
    read_field(j, "log_components", config.log_components);
    read_field(j, "trace_storage", config.trace_storage);
    read_field(j, "journal_storage", config.journal_storage);
    return config;
}

Config Config::from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed config file " + path + ": " + e.what());
    }
    return from_json(j);
}

Config Config::from_env(Config base) {
    if (const char* level = std::getenv("CELLAR_LOG_LEVEL")) {
        base.log_level = string_to_log_level(level);
    }
    if (const char* trace = std::getenv("CELLAR_TRACE_STORAGE")) {
        base.trace_storage = parse_flag(trace);
    }
    if (const char* journal = std::getenv("CELLAR_JOURNAL_STORAGE")) {
        base.journal_storage = parse_flag(journal);
    }
    return base;
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;
    j["log_level"] = log_level_to_string(log_level);
    j["log_timestamps"] = log_timestamps;
    j["log_components"] = log_components;
    j["trace_storage"] = trace_storage;
    j["journal_storage"] = journal_storage;
    return j;
}

void Config::apply() const {
    set_log_level(log_level);
    set_log_timestamp(log_timestamps);
    set_log_component(log_components);
}

} // namespace cellar
