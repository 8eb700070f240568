/**
 * @file lazy_array.hpp
 * @brief Lazily loaded array with a fixed capacity
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "errors.hpp"
#include "lazy_chunk.hpp"

namespace cellar {

/**
 * N elements laid out like a LazyChunk. Reads past the capacity yield
 * nothing; writes past it and the indexing operators throw
 * IndexOutOfBounds.
 */
template <typename T, uint32_t N>
class LazyArray : private LazyCache<uint32_t, T, ChunkKeys<T>> {
    using Base = LazyCache<uint32_t, T, ChunkKeys<T>>;

public:
    using Index = uint32_t;
    static constexpr uint64_t FOOTPRINT = static_cast<uint64_t>(N) * footprint_v<T>;

    LazyArray() : Base("LazyArray") {}

    static LazyArray pull_spread(HostStorage& storage, KeyPtr& ptr) {
        LazyArray array;
        array.bind(storage, ptr.next_for<LazyArray>());
        return array;
    }

    void push_spread(HostStorage& storage, KeyPtr& ptr) {
        this->flush(storage, ptr.next_for<LazyArray>());
    }

    void clear_spread(HostStorage& storage, KeyPtr& ptr) {
        this->clear_cached(storage, ptr.next_for<LazyArray>());
    }

    static constexpr uint32_t capacity() { return N; }

    using Base::cached_count;
    using Base::key;
    using Base::mutated_count;

    std::optional<Key> key_at(Index index) const {
        if (index >= N) {
            return std::nullopt;
        }
        return Base::key_at(index);
    }

    const T* get(Index index) { return index < N ? Base::get(index) : nullptr; }
    T* get_mut(Index index) { return index < N ? Base::get_mut(index) : nullptr; }

    std::optional<T> take(Index index) {
        if (index >= N) {
            return std::nullopt;
        }
        return Base::take(index);
    }

    void put(Index index, std::optional<T> value) {
        check_bounds(index);
        Base::put(index, std::move(value));
    }

    std::optional<T> put_get(Index index, std::optional<T> value) {
        check_bounds(index);
        return Base::put_get(index, std::move(value));
    }

    void swap(Index a, Index b) {
        check_bounds(a);
        check_bounds(b);
        Base::swap(a, b);
    }

    void clear_packed_at(Index index) {
        check_bounds(index);
        Base::clear_packed_at(index);
    }

    const T& at(Index index) {
        check_bounds(index);
        const T* value = Base::get(index);
        if (!value) {
            throw IndexOutOfBounds("LazyArray: no element at index " + std::to_string(index));
        }
        return *value;
    }

    T& operator[](Index index) {
        check_bounds(index);
        T* value = Base::get_mut(index);
        if (!value) {
            throw IndexOutOfBounds("LazyArray: no element at index " + std::to_string(index));
        }
        return *value;
    }

private:
    static void check_bounds(Index index) {
        if (index >= N) {
            throw IndexOutOfBounds("LazyArray: index " + std::to_string(index) +
                                   " out of bounds for capacity " + std::to_string(N));
        }
    }
};

} // namespace cellar
