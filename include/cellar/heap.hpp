/**
 * @file heap.hpp
 * @brief Ternary max-heap over a lazy chunk
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "lazy_cell.hpp"
#include "lazy_chunk.hpp"

namespace cellar {

/**
 * Elements `[0, len)` form a 3-ary heap: the children of `i` are
 * `3i + 1 .. 3i + 3`. With the default comparator the root is the
 * largest element.
 */
template <typename T, typename Compare = std::less<T>>
class Heap {
public:
    static constexpr uint32_t CHILDREN = 3;
    static constexpr uint64_t FOOTPRINT =
        footprint_v<LazyCell<uint32_t>> + footprint_v<LazyChunk<T>>;

    Heap() : len_(0u) {}

    static Heap pull_spread(HostStorage& storage, KeyPtr& ptr) {
        auto len = LazyCell<uint32_t>::pull_spread(storage, ptr);
        auto entries = LazyChunk<T>::pull_spread(storage, ptr);
        return Heap(std::move(len), std::move(entries));
    }

    void push_spread(HostStorage& storage, KeyPtr& ptr) {
        len_.push_spread(storage, ptr);
        entries_.push_spread(storage, ptr);
    }

    void clear_spread(HostStorage& storage, KeyPtr& ptr) {
        clear();
        len_.clear_spread(storage, ptr);
        entries_.push_spread(storage, ptr);
    }

    uint32_t len() { return len_.get(); }
    bool is_empty() { return len() == 0; }

    void push(T value) {
        uint32_t n = len();
        if (n == std::numeric_limits<uint32_t>::max()) {
            throw CapacityExceeded("Heap: cannot push more than u32::MAX elements");
        }
        entries_.put(n, std::move(value));
        len_.set(n + 1);
        sift_up(n);
    }

    /**
     * Removes and returns the largest element.
     */
    std::optional<T> pop() {
        uint32_t n = len();
        if (n == 0) {
            return std::nullopt;
        }
        len_.set(n - 1);
        if (n == 1) {
            return entries_.take(0);
        }
        std::optional<T> last = entries_.take(n - 1);
        std::optional<T> top = entries_.put_get(0, std::move(last));
        repair_top();
        return top;
    }

    const T* peek() { return is_empty() ? nullptr : entries_.get(0); }

    /**
     * Mutable root. The caller must keep the heap order intact.
     */
    T* peek_mut() { return is_empty() ? nullptr : entries_.get_mut(0); }

    /**
     * Copies of all elements in storage order, not in heap order.
     */
    std::vector<T> values() {
        std::vector<T> out;
        uint32_t n = len();
        out.reserve(n);
        for (uint32_t i = 0; i < n; ++i) {
            out.push_back(element(i));
        }
        return out;
    }

    void clear() {
        uint32_t n = len();
        for (uint32_t i = 0; i < n; ++i) {
            entries_.put(i, std::nullopt);
        }
        len_.set(0);
    }

private:
    Heap(LazyCell<uint32_t> len, LazyChunk<T> entries)
        : len_(std::move(len)), entries_(std::move(entries)) {}

    const T& element(uint32_t index) {
        const T* value = entries_.get(index);
        if (!value) {
            throw InvariantViolation("Heap: missing element at " + std::to_string(index));
        }
        return *value;
    }

    void sift_up(uint32_t index) {
        while (index > 0) {
            uint32_t parent = (index - 1) / CHILDREN;
            if (!compare_(element(parent), element(index))) {
                break;
            }
            entries_.swap(parent, index);
            index = parent;
        }
    }

    /**
     * Largest child of `index`, or nullopt for a leaf.
     */
    std::optional<uint32_t> find_successor(uint32_t index) {
        uint64_t first = static_cast<uint64_t>(index) * CHILDREN + 1;
        uint32_t n = len();
        if (first >= n) {
            return std::nullopt;
        }
        uint32_t best = static_cast<uint32_t>(first);
        uint64_t end = std::min<uint64_t>(first + CHILDREN, n);
        for (uint64_t child = first + 1; child < end; ++child) {
            if (compare_(element(best), element(static_cast<uint32_t>(child)))) {
                best = static_cast<uint32_t>(child);
            }
        }
        return best;
    }

    /// Sifts the root down until no child is larger.
    void repair_top() {
        uint32_t index = 0;
        while (auto successor = find_successor(index)) {
            if (!compare_(element(index), element(*successor))) {
                break;
            }
            entries_.swap(index, *successor);
            index = *successor;
        }
    }

    LazyCell<uint32_t> len_;
    LazyChunk<T> entries_;
    Compare compare_;
};

} // namespace cellar
