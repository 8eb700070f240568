/**
 * @file btree_node.cpp
 * @brief Node codec
 *
 * Only the live prefix of `pairs` and `edges` is encoded; the remaining
 * slots are empty by construction.
 */

#include "btree_node.hpp"

#include <string>

#include "errors.hpp"

namespace cellar {

void Codec<Node>::encode(Encoder& enc, const Node& node) {
    encode_to(enc, node.parent);
    encode_to(enc, node.parent_idx);
    encode_to(enc, node.len);
    for (uint32_t i = 0; i < node.len; ++i) {
        encode_to(enc, *node.pairs[i]);
    }
    bool leaf = node.is_leaf();
    encode_to(enc, leaf);
    if (!leaf) {
        for (uint32_t i = 0; i <= node.len; ++i) {
            encode_to(enc, *node.edges[i]);
        }
    }
}

Node Codec<Node>::decode(Decoder& dec) {
    Node node;
    node.parent = decode_from<std::optional<NodeHandle>>(dec);
    node.parent_idx = decode_from<std::optional<uint32_t>>(dec);
    node.len = decode_from<uint32_t>(dec);
    if (node.len > btree::CAPACITY) {
        throw DecodeError("B-tree node length " + std::to_string(node.len) +
                          " exceeds capacity");
    }
    for (uint32_t i = 0; i < node.len; ++i) {
        node.pairs[i] = decode_from<KVStorageIndex>(dec);
    }
    if (!decode_from<bool>(dec)) {
        for (uint32_t i = 0; i <= node.len; ++i) {
            node.edges[i] = decode_from<NodeHandle>(dec);
        }
    }
    return node;
}

} // namespace cellar
