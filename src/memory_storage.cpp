/**
 * @file memory_storage.cpp
 * @brief In-process host storage
 */

#include "memory_storage.hpp"

#include <iomanip>
#include <sstream>

#include "config.hpp"
#include "logging.hpp"

namespace cellar {

namespace {

std::string to_hex(std::span<const uint8_t> bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t b : bytes) {
        oss << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

} // namespace

MemoryStorage::MemoryStorage(const Config& config)
    : trace_(config.trace_storage), journal_on_(config.journal_storage) {}

void MemoryStorage::store(const Key& key, std::span<const uint8_t> value) {
    ++stats_.writes;
    if (journal_on_) {
        journal_.emplace_back(key, CellOp::Write);
    }
    cells_[key] = Bytes(value.begin(), value.end());
    if (trace_) {
        CELLAR_LOG_DEBUG("host", "store ", key.to_short_string(), " (", value.size(), " bytes)");
    }
}

std::optional<Bytes> MemoryStorage::load(const Key& key) {
    ++stats_.reads;
    auto it = cells_.find(key);
    if (trace_) {
        CELLAR_LOG_DEBUG("host", "load ", key.to_short_string(),
                         it == cells_.end() ? " -> none" : " -> hit");
    }
    if (it == cells_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryStorage::clear(const Key& key) {
    ++stats_.clears;
    if (journal_on_) {
        journal_.emplace_back(key, CellOp::Clear);
    }
    cells_.erase(key);
    if (trace_) {
        CELLAR_LOG_DEBUG("host", "clear ", key.to_short_string());
    }
}

std::optional<Bytes> MemoryStorage::peek(const Key& key) const {
    auto it = cells_.find(key);
    if (it == cells_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t MemoryStorage::mutations_of(const Key& key) const {
    size_t n = 0;
    for (const auto& [k, op] : journal_) {
        if (k == key) {
            ++n;
        }
    }
    return n;
}

void MemoryStorage::reset_stats() {
    stats_ = StorageStats{};
    journal_.clear();
}

void MemoryStorage::wipe() {
    cells_.clear();
    reset_stats();
}

nlohmann::json MemoryStorage::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [key, value] : cells_) {
        j[key.to_string()] = to_hex(value);
    }
    return j;
}

} // namespace cellar
