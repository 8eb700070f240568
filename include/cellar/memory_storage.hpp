/**
 * @file memory_storage.hpp
 * @brief In-process host storage with I/O accounting
 *
 * Stands in for the chain in tests and off-chain runs. Every store, load
 * and clear is counted so that callers can assert how much host traffic an
 * operation generated.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include <nlohmann/json.hpp>

#include "host_storage.hpp"

namespace cellar {

struct Config;

struct StorageStats {
    uint64_t reads = 0;
    uint64_t writes = 0;
    uint64_t clears = 0;

    uint64_t mutations() const { return writes + clears; }
};

enum class CellOp { Write, Clear };

class MemoryStorage : public HostStorage {
public:
    MemoryStorage() = default;
    explicit MemoryStorage(const Config& config);

    void store(const Key& key, std::span<const uint8_t> value) override;
    std::optional<Bytes> load(const Key& key) override;
    void clear(const Key& key) override;

    /**
     * Reads a cell without counting it as host traffic.
     */
    std::optional<Bytes> peek(const Key& key) const;

    const StorageStats& stats() const { return stats_; }

    /**
     * Writes and clears in call order since the last reset_stats(). Only
     * recorded while journaling is on; empty otherwise.
     */
    const std::vector<std::pair<Key, CellOp>>& journal() const { return journal_; }

    /// Number of journal records for `key`.
    size_t mutations_of(const Key& key) const;

    void set_journal(bool on) { journal_on_ = on; }
    bool journal_enabled() const { return journal_on_; }

    void reset_stats();

    size_t cell_count() const { return cells_.size(); }
    bool contains(const Key& key) const { return cells_.contains(key); }

    /// Drops every cell and resets the counters.
    void wipe();

    void set_trace(bool trace) { trace_ = trace; }
    bool trace() const { return trace_; }

    /**
     * Dump of all cells as {"0x...key": "hex bytes"} for debugging.
     */
    nlohmann::json to_json() const;

private:
    absl::flat_hash_map<Key, Bytes> cells_;
    StorageStats stats_;
    std::vector<std::pair<Key, CellOp>> journal_;
    bool trace_ = false;
    bool journal_on_ = false;
};

} // namespace cellar
