/**
 * @file storage_hash_map.hpp
 * @brief Iterable hash map with a length, kept in contract storage
 *
 * Values live at hashed keys through a LazyHashMap, so a lookup costs one
 * host read regardless of the map size. Keys are additionally stored in a
 * Stash, which gives the map its length and lets it enumerate its keys.
 * Each value records the stash slot of its key so that removal frees the
 * slot without a search.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "codec.hpp"
#include "errors.hpp"
#include "hashing.hpp"
#include "lazy_hash_map.hpp"
#include "stash.hpp"

namespace cellar {

template <typename V>
struct HashMapValue {
    V value;
    uint32_t key_index = 0;     // stash slot holding the key
};

template <typename V>
struct Codec<HashMapValue<V>> {
    static void encode(Encoder& enc, const HashMapValue<V>& entry) {
        encode_to(enc, entry.value);
        encode_to(enc, entry.key_index);
    }

    static HashMapValue<V> decode(Decoder& dec) {
        V value = decode_from<V>(dec);
        uint32_t key_index = decode_from<uint32_t>(dec);
        return HashMapValue<V>{std::move(value), key_index};
    }
};

template <typename K, typename V, typename H = Sha2x256>
class StorageHashMap {
    using Slot = HashMapValue<V>;

public:
    static constexpr uint64_t FOOTPRINT =
        footprint_v<Stash<K>> + footprint_v<LazyHashMap<K, Slot, H>>;

    StorageHashMap() = default;

    static StorageHashMap pull_spread(HostStorage& storage, KeyPtr& ptr) {
        auto keys = Stash<K>::pull_spread(storage, ptr);
        auto values = LazyHashMap<K, Slot, H>::pull_spread(storage, ptr);
        return StorageHashMap(std::move(keys), std::move(values));
    }

    void push_spread(HostStorage& storage, KeyPtr& ptr) {
        keys_.push_spread(storage, ptr);
        values_.push_spread(storage, ptr);
    }

    /**
     * Clears every key, value and header cell.
     */
    void clear_spread(HostStorage& storage, KeyPtr& ptr) {
        clear();
        keys_.clear_spread(storage, ptr);
        values_.clear_spread(storage, ptr);
    }

    uint32_t len() { return keys_.len(); }
    bool is_empty() { return keys_.is_empty(); }

    const V* get(const K& key) {
        const Slot* slot = values_.get(key);
        return slot ? &slot->value : nullptr;
    }

    V* get_mut(const K& key) {
        Slot* slot = values_.get_mut(key);
        return slot ? &slot->value : nullptr;
    }

    bool contains_key(const K& key) { return values_.get(key) != nullptr; }

    /**
     * Inserts or replaces. A replaced value keeps its key slot; only a new
     * key takes a stash slot. Returns the previous value, if any.
     */
    std::optional<V> insert(K key, V value) {
        if (Slot* slot = values_.get_mut(key)) {
            return std::exchange(slot->value, std::move(value));
        }
        uint32_t key_index = keys_.put(key);
        values_.put(key, Slot{std::move(value), key_index});
        return std::nullopt;
    }

    /**
     * Removes the value of `key` and frees its key slot.
     */
    std::optional<V> take(const K& key) {
        std::optional<Slot> slot = values_.put_get(key, std::nullopt);
        if (!slot) {
            return std::nullopt;
        }
        if (!keys_.take(slot->key_index)) {
            throw InvariantViolation("StorageHashMap: key slot " +
                                     std::to_string(slot->key_index) + " is vacant");
        }
        return std::move(slot->value);
    }

    bool remove(const K& key) { return take(key).has_value(); }

    /**
     * Visits every pair in key slot order. Loads each key and its value.
     */
    template <typename F>
    void for_each(F&& fn) {
        keys_.for_each([this, &fn](uint32_t, const K& key) {
            const Slot* slot = values_.get(key);
            if (!slot) {
                throw InvariantViolation("StorageHashMap: stored key has no value");
            }
            fn(key, slot->value);
        });
    }

    std::vector<K> keys() {
        std::vector<K> out;
        out.reserve(len());
        keys_.for_each([&out](uint32_t, const K& key) { out.push_back(key); });
        return out;
    }

    /**
     * Removes every pair. Their cells are cleared on the next push.
     */
    void clear() {
        for (const K& key : keys()) {
            values_.put(key, std::nullopt);
        }
        keys_.clear();
    }

private:
    StorageHashMap(Stash<K> keys, LazyHashMap<K, Slot, H> values)
        : keys_(std::move(keys)), values_(std::move(values)) {}

    Stash<K> keys_;
    LazyHashMap<K, Slot, H> values_;
};

} // namespace cellar
