/**
 * @file storage_vec.hpp
 * @brief Contiguous growable vector kept in contract storage
 */

#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>

#include "errors.hpp"
#include "lazy_cell.hpp"
#include "lazy_index_map.hpp"

namespace cellar {

/**
 * Length cell followed by a LazyIndexMap of packed elements.
 *
 * Elements are loaded one at a time on access; a freshly constructed
 * vector is empty and only touches storage when pushed.
 */
template <typename T>
class StorageVec {
public:
    static constexpr uint64_t FOOTPRINT =
        footprint_v<LazyCell<uint32_t>> + footprint_v<LazyIndexMap<T>>;

    StorageVec() : len_(0u) {}

    static StorageVec pull_spread(HostStorage& storage, KeyPtr& ptr) {
        auto len = LazyCell<uint32_t>::pull_spread(storage, ptr);
        auto elems = LazyIndexMap<T>::pull_spread(storage, ptr);
        return StorageVec(std::move(len), std::move(elems));
    }

    void push_spread(HostStorage& storage, KeyPtr& ptr) {
        len_.push_spread(storage, ptr);
        elems_.push_spread(storage, ptr);
    }

    /**
     * Clears every element cell and the length cell.
     */
    void clear_spread(HostStorage& storage, KeyPtr& ptr) {
        uint32_t n = len();
        for (uint32_t i = 0; i < n; ++i) {
            elems_.put(i, std::nullopt);
        }
        len_.clear_spread(storage, ptr);
        elems_.push_spread(storage, ptr);
    }

    uint32_t len() { return len_.get(); }
    bool is_empty() { return len() == 0; }

    const T* get(uint32_t index) { return index < len() ? elems_.get(index) : nullptr; }
    T* get_mut(uint32_t index) { return index < len() ? elems_.get_mut(index) : nullptr; }

    const T& at(uint32_t index) {
        const T* value = get(index);
        if (!value) {
            throw IndexOutOfBounds(out_of_bounds_message(index));
        }
        return *value;
    }

    T& at_mut(uint32_t index) {
        T* value = get_mut(index);
        if (!value) {
            throw IndexOutOfBounds(out_of_bounds_message(index));
        }
        return *value;
    }

    const T* first() { return get(0); }
    const T* last() {
        uint32_t n = len();
        return n == 0 ? nullptr : get(n - 1);
    }

    void push(T value) {
        uint32_t n = len();
        if (n == std::numeric_limits<uint32_t>::max()) {
            throw CapacityExceeded("StorageVec: cannot push more than u32::MAX elements");
        }
        elems_.put(n, std::move(value));
        len_.set(n + 1);
    }

    std::optional<T> pop() {
        uint32_t n = len();
        if (n == 0) {
            return std::nullopt;
        }
        len_.set(n - 1);
        return elems_.take(n - 1);
    }

    /**
     * Overwrites element `index` without loading it first.
     */
    void set(uint32_t index, T value) {
        if (index >= len()) {
            throw IndexOutOfBounds(out_of_bounds_message(index));
        }
        elems_.put(index, std::move(value));
    }

    void swap(uint32_t a, uint32_t b) {
        uint32_t n = len();
        if (a >= n || b >= n) {
            throw IndexOutOfBounds(out_of_bounds_message(a >= n ? a : b));
        }
        elems_.swap(a, b);
    }

    /**
     * Removes element `index` by moving the last element into its place.
     */
    std::optional<T> swap_remove(uint32_t index) {
        uint32_t n = len();
        if (index >= n) {
            return std::nullopt;
        }
        elems_.swap(index, n - 1);
        return pop();
    }

    /**
     * Drops all elements. Storage cells are cleared on the next push.
     */
    void clear() {
        uint32_t n = len();
        for (uint32_t i = 0; i < n; ++i) {
            elems_.put(i, std::nullopt);
        }
        len_.set(0);
    }

    /**
     * Visits elements in index order.
     */
    template <typename F>
    void for_each(F&& fn) {
        uint32_t n = len();
        for (uint32_t i = 0; i < n; ++i) {
            fn(i, at(i));
        }
    }

private:
    StorageVec(LazyCell<uint32_t> len, LazyIndexMap<T> elems)
        : len_(std::move(len)), elems_(std::move(elems)) {}

    std::string out_of_bounds_message(uint32_t index) {
        return "StorageVec: index " + std::to_string(index) + " out of bounds for length " +
               std::to_string(len());
    }

    LazyCell<uint32_t> len_;
    LazyIndexMap<T> elems_;
};

} // namespace cellar
