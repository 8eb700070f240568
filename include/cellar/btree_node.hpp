/**
 * @file btree_node.hpp
 * @brief Node layout of the storage B-tree
 *
 * Nodes never hold keys or values directly. They refer to key/value pairs
 * by KVStorageIndex and to other nodes by NodeHandle, both indices into
 * separate stashes. Rebalancing therefore only moves small indices; the
 * pairs themselves stay where they were first stored.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>

#include "codec.hpp"

namespace cellar {

namespace btree {

constexpr uint32_t B = 6;
constexpr uint32_t CAPACITY = 2 * B - 1;
constexpr uint32_t EDGES = 2 * B;
constexpr uint32_t MIN_LEN = B - 1;

} // namespace btree

struct NodeHandle {
    uint32_t value = 0;

    friend bool operator==(NodeHandle a, NodeHandle b) { return a.value == b.value; }
    friend bool operator!=(NodeHandle a, NodeHandle b) { return a.value != b.value; }
};

struct KVStorageIndex {
    uint32_t value = 0;

    friend bool operator==(KVStorageIndex a, KVStorageIndex b) { return a.value == b.value; }
    friend bool operator!=(KVStorageIndex a, KVStorageIndex b) { return a.value != b.value; }
};

struct Node {
    std::optional<NodeHandle> parent;
    std::optional<uint32_t> parent_idx;     // slot of this node in parent's edges
    std::array<std::optional<KVStorageIndex>, btree::CAPACITY> pairs{};
    std::array<std::optional<NodeHandle>, btree::EDGES> edges{};
    uint32_t len = 0;

    bool is_leaf() const { return !edges[0].has_value(); }
};

template <>
struct Codec<NodeHandle> {
    static void encode(Encoder& enc, NodeHandle h) { encode_to(enc, h.value); }
    static NodeHandle decode(Decoder& dec) { return NodeHandle{decode_from<uint32_t>(dec)}; }
};

template <>
struct Codec<KVStorageIndex> {
    static void encode(Encoder& enc, KVStorageIndex i) { encode_to(enc, i.value); }
    static KVStorageIndex decode(Decoder& dec) { return KVStorageIndex{decode_from<uint32_t>(dec)}; }
};

template <>
struct Codec<Node> {
    static void encode(Encoder& enc, const Node& node);
    static Node decode(Decoder& dec);
};

namespace btree {

/**
 * Inserts `value` at `idx` into the first `len` slots of `slots`,
 * shifting the tail right by one. Slot `len` must be free.
 */
template <typename S, size_t N>
void slice_insert(std::array<std::optional<S>, N>& slots, uint32_t len, uint32_t idx,
                  std::optional<S> value) {
    for (uint32_t i = len; i > idx; --i) {
        slots[i] = slots[i - 1];
    }
    slots[idx] = value;
}

/**
 * Removes and returns slot `idx` of the first `len` slots, shifting the
 * tail left by one and emptying slot `len - 1`.
 */
template <typename S, size_t N>
std::optional<S> slice_remove(std::array<std::optional<S>, N>& slots, uint32_t len, uint32_t idx) {
    std::optional<S> removed = slots[idx];
    for (uint32_t i = idx; i + 1 < len; ++i) {
        slots[i] = slots[i + 1];
    }
    slots[len - 1].reset();
    return removed;
}

} // namespace btree

} // namespace cellar
