/**
 * @file lazy_cache.hpp
 * @brief Load-through cache shared by the lazy containers
 *
 * LazyCache maps an index domain onto storage keys through a KeyMap
 * policy (`static Key map(const Key& root, const Index&)`), loads elements
 * on first access and flushes only entries that were mutated since the
 * last push. Flush cost is therefore proportional to the number of
 * mutated entries, not to the size of the cache or of the index domain.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>

#include "absl/container/node_hash_map.h"

#include "entry.hpp"
#include "host_storage.hpp"
#include "key.hpp"
#include "logging.hpp"
#include "storage_traits.hpp"

namespace cellar {

template <typename Index, typename T, typename KeyMap>
class LazyCache {
public:
    LazyCache(LazyCache&&) = default;
    LazyCache& operator=(LazyCache&&) = default;
    LazyCache(const LazyCache&) = delete;
    LazyCache& operator=(const LazyCache&) = delete;

    /// Root key, or nullopt for a container that was never pulled or pushed.
    const std::optional<Key>& key() const { return binding_.key(); }

    Key key_at(const Index& index) const {
        return KeyMap::map(binding_.root(name_), index);
    }

    /**
     * Shared access; loads on a cache miss. Null if no value is stored.
     */
    const T* get(const Index& index) {
        const auto& value = load_through(index).value();
        return value ? &*value : nullptr;
    }

    /**
     * Mutable access; marks the entry dirty if a value is present.
     */
    T* get_mut(const Index& index) {
        auto& value = load_through(index).value_mut();
        return value ? &*value : nullptr;
    }

    /**
     * Removes and returns the value. The cached entry stays as an empty,
     * dirty slot so the next push clears the cell.
     */
    std::optional<T> take(const Index& index) { return load_through(index).take_value(); }

    /**
     * Overwrites the value without reading the previous one from storage.
     */
    void put(const Index& index, std::optional<T> value) {
        auto it = cached_.find(index);
        if (it != cached_.end()) {
            it->second.put(std::move(value));
            return;
        }
        cached_.try_emplace(index, std::move(value), EntryState::Mutated);
    }

    /**
     * Overwrites the value and returns the displaced one. Costs one host
     * read on a cache miss.
     */
    std::optional<T> put_get(const Index& index, std::optional<T> value) {
        return load_through(index).put(std::move(value));
    }

    /**
     * Exchanges two values. Nothing is dirtied when both are absent.
     */
    void swap(const Index& a, const Index& b) {
        if (a == b) {
            return;
        }
        Entry<T>& ea = load_through(a);
        Entry<T>& eb = load_through(b);
        if (!ea.value() && !eb.value()) {
            return;
        }
        std::optional<T> va = ea.take_value();
        std::optional<T> vb = eb.take_value();
        ea.put(std::move(vb));
        eb.put(std::move(va));
    }

    /**
     * Clears the cell of `index` in storage right away and caches it as
     * empty and clean.
     */
    void clear_packed_at(const Index& index) {
        HostStorage& host = binding_.host(name_);
        host.clear(key_at(index));
        auto it = cached_.find(index);
        if (it != cached_.end()) {
            it->second.put(std::nullopt);
            it->second.set_state(EntryState::Preserved);
        } else {
            cached_.try_emplace(index, std::nullopt, EntryState::Preserved);
        }
    }

    size_t cached_count() const { return cached_.size(); }

    size_t mutated_count() const {
        size_t n = 0;
        for (const auto& [index, entry] : cached_) {
            if (entry.is_mutated()) {
                ++n;
            }
        }
        return n;
    }

protected:
    explicit LazyCache(const char* name) : name_(name) {}

    void bind(HostStorage& host, const Key& root) { binding_.bind(host, root, name_); }

    /**
     * Writes every mutated entry below `root` and resets it to clean.
     */
    void flush(HostStorage& host, const Key& root) {
        bind(host, root);
        size_t written = 0;
        for (auto& [index, entry] : cached_) {
            Key key = KeyMap::map(root, index);
            bool io;
            if constexpr (is_spread_v<T>) {
                io = entry.push_spread_root(host, key);
            } else {
                io = entry.push_packed_root(host, key);
            }
            written += io ? 1 : 0;
        }
        if (written > 0) {
            CELLAR_LOG_DEBUG("lazy", name_, " at ", root.to_short_string(), ": flushed ",
                             written, " of ", cached_.size(), " cached entries");
        }
    }

    /**
     * Clears the cells of every cached index. Cells that were never loaded
     * are unknown to the cache and stay untouched.
     */
    void clear_cached(HostStorage& host, const Key& root) {
        bind(host, root);
        for (auto& [index, entry] : cached_) {
            Key key = KeyMap::map(root, index);
            if constexpr (is_spread_v<T>) {
                if (entry.value()) {
                    std::optional<T>& value = entry.value_mut();
                    clear_spread_root(*value, host, key);
                }
            }
            host.clear(key);
            entry.put(std::nullopt);
            entry.set_state(EntryState::Preserved);
        }
    }

    Entry<T>& load_through(const Index& index) {
        auto it = cached_.find(index);
        if (it != cached_.end()) {
            return it->second;
        }
        const Key& root = binding_.root(name_);
        HostStorage& host = binding_.host(name_);
        Key key = KeyMap::map(root, index);
        if constexpr (is_spread_v<T>) {
            return cached_.try_emplace(index, Entry<T>::pull_spread_root(host, key)).first->second;
        } else {
            return cached_.try_emplace(index, Entry<T>::pull_packed_root(host, key)).first->second;
        }
    }

private:
    const char* name_ = "lazy container";
    StorageBinding binding_;
    absl::node_hash_map<Index, Entry<T>> cached_;
};

} // namespace cellar
