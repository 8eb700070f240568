/**
 * @file lazy_hash_map.hpp
 * @brief Lazily loaded mapping over an unbounded key domain
 */

#pragma once

#include "hashing.hpp"
#include "lazy_cache.hpp"

namespace cellar {

/**
 * The cell of `k` is `H(encode(root) ++ encode(k))`, which scatters
 * arbitrary, non-contiguous keys over the storage key space.
 */
template <typename K, typename H>
struct HashKeys {
    static Key map(const Key& root, const K& key) {
        return HashBuilder<H>().update(root).update(key).finish();
    }
};

template <typename K, typename V, typename H = Sha2x256>
class LazyHashMap : public LazyCache<K, V, HashKeys<K, H>> {
    using Base = LazyCache<K, V, HashKeys<K, H>>;

public:
    // only the root cell is reserved; values live at hashed keys
    static constexpr uint64_t FOOTPRINT = 1;

    LazyHashMap() : Base("LazyHashMap") {}

    static LazyHashMap pull_spread(HostStorage& storage, KeyPtr& ptr) {
        LazyHashMap map;
        map.bind(storage, ptr.next_for<LazyHashMap>());
        return map;
    }

    void push_spread(HostStorage& storage, KeyPtr& ptr) {
        this->flush(storage, ptr.next_for<LazyHashMap>());
    }

    void clear_spread(HostStorage& storage, KeyPtr& ptr) {
        this->clear_cached(storage, ptr.next_for<LazyHashMap>());
    }
};

} // namespace cellar
