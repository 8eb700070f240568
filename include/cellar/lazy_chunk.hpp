/**
 * @file lazy_chunk.hpp
 * @brief Lazily loaded chunk of 2^32 consecutive elements
 */

#pragma once

#include <cstdint>

#include "lazy_cache.hpp"

namespace cellar {

/**
 * Element `i` lives at `root + i * footprint<T>`. Spread elements are
 * pushed with their own spread layout starting at that key.
 */
template <typename T>
struct ChunkKeys {
    static Key map(const Key& root, uint32_t index) {
        return root + static_cast<u128>(index) * static_cast<u128>(footprint_v<T>);
    }
};

template <typename T>
class LazyChunk : public LazyCache<uint32_t, T, ChunkKeys<T>> {
    using Base = LazyCache<uint32_t, T, ChunkKeys<T>>;

public:
    using Index = uint32_t;
    static constexpr uint64_t FOOTPRINT = 1ULL << 32;

    LazyChunk() : Base("LazyChunk") {}

    static LazyChunk pull_spread(HostStorage& storage, KeyPtr& ptr) {
        LazyChunk chunk;
        chunk.bind(storage, ptr.next_for<LazyChunk>());
        return chunk;
    }

    void push_spread(HostStorage& storage, KeyPtr& ptr) {
        this->flush(storage, ptr.next_for<LazyChunk>());
    }

    void clear_spread(HostStorage& storage, KeyPtr& ptr) {
        this->clear_cached(storage, ptr.next_for<LazyChunk>());
    }
};

} // namespace cellar
