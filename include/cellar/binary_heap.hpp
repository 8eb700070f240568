/**
 * @file binary_heap.hpp
 * @brief Binary max-heap storing sibling pairs in one cell
 *
 * Element 0 sits alone in group 0; elements 2k-1 and 2k share group k.
 * A sift step compares two siblings, so keeping them in one cell halves
 * the loads per level.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "codec.hpp"
#include "errors.hpp"
#include "lazy_cell.hpp"
#include "storage_vec.hpp"

namespace cellar {

template <typename T>
struct Children {
    std::optional<T> left;
    std::optional<T> right;

    uint32_t count() const { return (left ? 1 : 0) + (right ? 1 : 0); }

    std::optional<T>& child(uint32_t pos) { return pos == 0 ? left : right; }
    const std::optional<T>& child(uint32_t pos) const { return pos == 0 ? left : right; }
};

template <typename T>
struct Codec<Children<T>> {
    static void encode(Encoder& enc, const Children<T>& c) {
        encode_to(enc, c.left);
        encode_to(enc, c.right);
    }

    static Children<T> decode(Decoder& dec) {
        Children<T> c;
        c.left = decode_from<std::optional<T>>(dec);
        c.right = decode_from<std::optional<T>>(dec);
        return c;
    }
};

inline uint32_t children_group(uint32_t index) { return index == 0 ? 0 : (index + 1) / 2; }
inline uint32_t child_position(uint32_t index) { return index == 0 ? 0 : (index + 1) % 2; }

template <typename T, typename Compare = std::less<T>>
class BinaryHeap {
public:
    static constexpr uint64_t FOOTPRINT =
        footprint_v<LazyCell<uint32_t>> + footprint_v<StorageVec<Children<T>>>;

    /**
     * Mutable handle to the root. Restores the heap order when it goes
     * out of scope.
     */
    class PeekMut {
    public:
        ~PeekMut() {
            if (heap_ && sift_) {
                heap_->sift_down(0);
            }
        }

        PeekMut(PeekMut&& other) noexcept : heap_(other.heap_), sift_(other.sift_) {
            other.heap_ = nullptr;
        }
        PeekMut(const PeekMut&) = delete;
        PeekMut& operator=(const PeekMut&) = delete;
        PeekMut& operator=(PeekMut&&) = delete;

        T& operator*() { return *heap_->slot(0); }
        T* operator->() { return &*heap_->slot(0); }

        /// Removes the root through the guard; no sift on destruction.
        T pop() {
            sift_ = false;
            return *heap_->pop();
        }

    private:
        friend class BinaryHeap;
        explicit PeekMut(BinaryHeap* heap) : heap_(heap) {}

        BinaryHeap* heap_;
        bool sift_ = true;
    };

    BinaryHeap() : len_(0u) {}

    static BinaryHeap pull_spread(HostStorage& storage, KeyPtr& ptr) {
        auto len = LazyCell<uint32_t>::pull_spread(storage, ptr);
        auto children = StorageVec<Children<T>>::pull_spread(storage, ptr);
        return BinaryHeap(std::move(len), std::move(children));
    }

    void push_spread(HostStorage& storage, KeyPtr& ptr) {
        len_.push_spread(storage, ptr);
        children_.push_spread(storage, ptr);
    }

    void clear_spread(HostStorage& storage, KeyPtr& ptr) {
        len_.clear_spread(storage, ptr);
        children_.clear_spread(storage, ptr);
    }

    uint32_t len() { return len_.get(); }
    bool is_empty() { return len() == 0; }

    void push(T value) {
        uint32_t n = len();
        if (n == std::numeric_limits<uint32_t>::max()) {
            throw CapacityExceeded("BinaryHeap: cannot push more than u32::MAX elements");
        }
        uint32_t group = children_group(n);
        if (group < children_.len()) {
            children_.at_mut(group).child(child_position(n)) = std::move(value);
        } else {
            Children<T> c;
            c.left = std::move(value);
            children_.push(std::move(c));
        }
        len_.set(n + 1);
        sift_up(n);
    }

    std::optional<T> pop() {
        uint32_t n = len();
        if (n == 0) {
            return std::nullopt;
        }
        swap(0, n - 1);
        std::optional<T> top = remove_last();
        sift_down(0);
        return top;
    }

    const T* peek() {
        if (is_empty()) {
            return nullptr;
        }
        const auto& root = children_.at(0).left;
        return root ? &*root : nullptr;
    }

    std::optional<PeekMut> peek_mut() {
        if (is_empty()) {
            return std::nullopt;
        }
        return PeekMut(this);
    }

    void clear() {
        if (is_empty()) {
            return;
        }
        children_.clear();
        len_.set(0);
    }

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

    /// Number of Children cells, for inspecting the grouping.
    uint32_t group_count() { return children_.len(); }

private:
    BinaryHeap(LazyCell<uint32_t> len, StorageVec<Children<T>> children)
        : len_(std::move(len)), children_(std::move(children)) {}

    std::optional<T>& slot(uint32_t index) {
        return children_.at_mut(children_group(index)).child(child_position(index));
    }

    const T& element(uint32_t index) {
        const auto& value = children_.at(children_group(index)).child(child_position(index));
        if (!value) {
            throw InvariantViolation("BinaryHeap: missing element at " + std::to_string(index));
        }
        return *value;
    }

    void swap(uint32_t a, uint32_t b) {
        if (a == b) {
            return;
        }
        std::swap(slot(a), slot(b));
    }

    std::optional<T> remove_last() {
        uint32_t last = len() - 1;
        len_.set(last);
        uint32_t group = children_group(last);
        std::optional<T> value = std::move(slot(last));
        slot(last).reset();
        if (children_.at(group).count() == 0) {
            children_.pop();
        }
        return value;
    }

    void sift_up(uint32_t pos) {
        while (pos > 0) {
            uint32_t parent = (pos - 1) / 2;
            if (!compare_(element(parent), element(pos))) {
                break;
            }
            swap(parent, pos);
            pos = parent;
        }
    }

    void sift_down(uint32_t pos) {
        uint32_t end = len();
        uint64_t child = 2 * static_cast<uint64_t>(pos) + 1;
        while (child < end) {
            uint64_t right = child + 1;
            if (right < end && !compare_(element(static_cast<uint32_t>(right)),
                                         element(static_cast<uint32_t>(child)))) {
                child = right;
            }
            if (!compare_(element(pos), element(static_cast<uint32_t>(child)))) {
                break;
            }
            swap(static_cast<uint32_t>(child), pos);
            pos = static_cast<uint32_t>(child);
            child = 2 * static_cast<uint64_t>(pos) + 1;
        }
    }

    LazyCell<uint32_t> len_;
    StorageVec<Children<T>> children_;
    Compare compare_;
};

} // namespace cellar
