/**
 * @file lazy_index_map.hpp
 * @brief Lazily loaded mapping from u32 indices to packed values
 */

#pragma once

#include <cstdint>

#include "lazy_cache.hpp"

namespace cellar {

struct IndexKeys {
    static Key map(const Key& root, uint32_t index) { return root + index; }
};

/**
 * Value `i` is packed into the single cell at `root + i`.
 */
template <typename V>
class LazyIndexMap : public LazyCache<uint32_t, V, IndexKeys> {
    using Base = LazyCache<uint32_t, V, IndexKeys>;

    static_assert(!is_spread_v<V>, "LazyIndexMap stores packed values only");

public:
    using Index = uint32_t;
    static constexpr uint64_t FOOTPRINT = 1ULL << 32;

    LazyIndexMap() : Base("LazyIndexMap") {}

    static LazyIndexMap pull_spread(HostStorage& storage, KeyPtr& ptr) {
        LazyIndexMap map;
        map.bind(storage, ptr.next_for<LazyIndexMap>());
        return map;
    }

    void push_spread(HostStorage& storage, KeyPtr& ptr) {
        this->flush(storage, ptr.next_for<LazyIndexMap>());
    }

    void clear_spread(HostStorage& storage, KeyPtr& ptr) {
        this->clear_cached(storage, ptr.next_for<LazyIndexMap>());
    }
};

} // namespace cellar
