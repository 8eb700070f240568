/**
 * @file btree_map.hpp
 * @brief Ordered map stored as a B-tree of individually addressed nodes
 *
 * Layout: a header cell {root, len}, a stash of nodes and a stash of
 * key/value pairs. Every node and every pair occupies its own cell, so a
 * lookup loads one cell per level plus the pairs it compares against.
 *
 * Nodes hold at most CAPACITY pairs. An insert that overflows a node
 * splits it: the left half keeps B pairs, the pair at position B moves up
 * into the parent and the right half receives the remaining B - 1. A
 * remove that leaves a non-root node with fewer than B - 1 pairs merges it
 * with a sibling when both fit into one node, and otherwise takes one
 * pair from the sibling through the parent.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "btree_node.hpp"
#include "codec.hpp"
#include "errors.hpp"
#include "lazy_cell.hpp"
#include "logging.hpp"
#include "stash.hpp"

namespace cellar {

template <typename K, typename V>
struct KVPair {
    K key;
    V value;
};

template <typename K, typename V>
struct Codec<KVPair<K, V>> {
    static void encode(Encoder& enc, const KVPair<K, V>& kv) {
        encode_to(enc, kv.key);
        encode_to(enc, kv.value);
    }

    static KVPair<K, V> decode(Decoder& dec) {
        K key = decode_from<K>(dec);
        V value = decode_from<V>(dec);
        return {std::move(key), std::move(value)};
    }
};

struct BTreeHeader {
    std::optional<NodeHandle> root;
    uint32_t len = 0;
};

template <>
struct Codec<BTreeHeader> {
    static void encode(Encoder& enc, const BTreeHeader& h) {
        encode_to(enc, h.root);
        encode_to(enc, h.len);
    }

    static BTreeHeader decode(Decoder& dec) {
        BTreeHeader h;
        h.root = decode_from<std::optional<NodeHandle>>(dec);
        h.len = decode_from<uint32_t>(dec);
        return h;
    }
};

template <typename K, typename V, typename Compare = std::less<K>>
class BTreeMap {
    /// Position of a pair in a node, or of the edge a search descends to.
    struct Position {
        NodeHandle node;
        uint32_t idx;
    };

    struct SearchResult {
        bool found;
        Position pos;
    };

public:
    using Pair = KVPair<K, V>;

    static constexpr uint64_t FOOTPRINT = footprint_v<LazyCell<BTreeHeader>> +
                                          footprint_v<Stash<Node>> + footprint_v<Stash<Pair>>;

    //=========================================================================
    // Entry API
    //=========================================================================

    class VacantEntry {
    public:
        const K& key() const { return key_; }
        K into_key() { return std::move(key_); }

        /// Inserts the value and returns a reference to it.
        V& insert(V value) {
            KVStorageIndex kv = map_->insert_new(search_, std::move(key_), std::move(value));
            return map_->pair_mut(kv).value;
        }

    private:
        friend class BTreeMap;
        VacantEntry(BTreeMap* map, K key, std::optional<SearchResult> search)
            : map_(map), key_(std::move(key)), search_(search) {}

        BTreeMap* map_;
        K key_;
        std::optional<SearchResult> search_;
    };

    class OccupiedEntry {
    public:
        const K& key() const { return map_->pair(kv_).key; }
        const V& get() const { return map_->pair(kv_).value; }
        V& get_mut() { return map_->pair_mut(kv_).value; }

        /// Replaces the value and returns the old one.
        V insert(V value) { return std::exchange(get_mut(), std::move(value)); }

        V remove() { return remove_entry().value; }
        Pair remove_entry() { return map_->remove_at(pos_); }

    private:
        friend class BTreeMap;
        OccupiedEntry(BTreeMap* map, Position pos, KVStorageIndex kv)
            : map_(map), pos_(pos), kv_(kv) {}

        BTreeMap* map_;
        Position pos_;
        KVStorageIndex kv_;
    };

    class Entry {
    public:
        bool is_occupied() const { return std::holds_alternative<OccupiedEntry>(entry_); }

        VacantEntry* vacant() { return std::get_if<VacantEntry>(&entry_); }
        OccupiedEntry* occupied() { return std::get_if<OccupiedEntry>(&entry_); }

        const K& key() const {
            if (const auto* o = std::get_if<OccupiedEntry>(&entry_)) {
                return o->key();
            }
            return std::get<VacantEntry>(entry_).key();
        }

        V& or_insert(V value) {
            if (auto* o = occupied()) {
                return o->get_mut();
            }
            return vacant()->insert(std::move(value));
        }

        template <typename F>
        V& or_insert_with(F&& make) {
            if (auto* o = occupied()) {
                return o->get_mut();
            }
            return vacant()->insert(make());
        }

        template <typename F>
        Entry& and_modify(F&& fn) {
            if (auto* o = occupied()) {
                fn(o->get_mut());
            }
            return *this;
        }

    private:
        friend class BTreeMap;
        explicit Entry(VacantEntry v) : entry_(std::move(v)) {}
        explicit Entry(OccupiedEntry o) : entry_(std::move(o)) {}

        std::variant<VacantEntry, OccupiedEntry> entry_;
    };

    //=========================================================================
    // Construction and layout
    //=========================================================================

    BTreeMap() : header_(BTreeHeader{}) {}

    static BTreeMap pull_spread(HostStorage& storage, KeyPtr& ptr) {
        auto header = LazyCell<BTreeHeader>::pull_spread(storage, ptr);
        auto nodes = Stash<Node>::pull_spread(storage, ptr);
        auto pairs = Stash<Pair>::pull_spread(storage, ptr);
        return BTreeMap(std::move(header), std::move(nodes), std::move(pairs));
    }

    void push_spread(HostStorage& storage, KeyPtr& ptr) {
        header_.push_spread(storage, ptr);
        nodes_.push_spread(storage, ptr);
        pairs_.push_spread(storage, ptr);
    }

    void clear_spread(HostStorage& storage, KeyPtr& ptr) {
        clear();
        header_.clear_spread(storage, ptr);
        nodes_.clear_spread(storage, ptr);
        pairs_.clear_spread(storage, ptr);
    }

    //=========================================================================
    // Queries
    //=========================================================================

    uint32_t len() { return header_.get().len; }
    bool is_empty() { return len() == 0; }

    /// Nodes currently in use.
    uint32_t node_count() { return nodes_.len(); }

    const V* get(const K& key) {
        auto res = search(key);
        if (!res || !res->found) {
            return nullptr;
        }
        return &pair(kv_at(res->pos)).value;
    }

    V* get_mut(const K& key) {
        auto res = search(key);
        if (!res || !res->found) {
            return nullptr;
        }
        return &pair_mut(kv_at(res->pos)).value;
    }

    const Pair* get_key_value(const K& key) {
        auto res = search(key);
        if (!res || !res->found) {
            return nullptr;
        }
        return &pair(kv_at(res->pos));
    }

    bool contains_key(const K& key) { return get(key) != nullptr; }

    //=========================================================================
    // Mutation
    //=========================================================================

    /**
     * Inserts or replaces. Returns the previous value, if any.
     */
    std::optional<V> insert(K key, V value) {
        auto res = search(key);
        if (res && res->found) {
            return std::exchange(pair_mut(kv_at(res->pos)).value, std::move(value));
        }
        insert_new(res, std::move(key), std::move(value));
        return std::nullopt;
    }

    std::optional<V> remove(const K& key) {
        auto kv = remove_entry(key);
        if (!kv) {
            return std::nullopt;
        }
        return std::move(kv->value);
    }

    std::optional<Pair> remove_entry(const K& key) {
        auto res = search(key);
        if (!res || !res->found) {
            return std::nullopt;
        }
        return remove_at(res->pos);
    }

    Entry entry(K key) {
        auto res = search(key);
        if (res && res->found) {
            return Entry(OccupiedEntry(this, res->pos, kv_at(res->pos)));
        }
        return Entry(VacantEntry(this, std::move(key), res));
    }

    /**
     * Removes every pair. All node and pair cells are cleared on the next
     * push.
     */
    void clear() {
        nodes_.clear();
        pairs_.clear();
        header_.set(BTreeHeader{});
    }

    //=========================================================================
    // Traversal
    //=========================================================================

    /**
     * Visits all pairs in ascending key order.
     */
    template <typename F>
    void for_each(F&& fn) {
        auto root = header_.get().root;
        if (root) {
            visit(*root, fn);
        }
    }

    std::vector<K> keys() {
        std::vector<K> out;
        for_each([&out](const K& key, const V&) { out.push_back(key); });
        return out;
    }

    //=========================================================================
    // Inspection
    //=========================================================================

    std::optional<NodeHandle> root() { return header_.get().root; }

    const Node* get_node(NodeHandle handle) { return nodes_.get(handle.value); }

    /**
     * Walks the whole tree and throws InvariantViolation if any structural
     * invariant is broken: parent links, fill bounds, uniform leaf depth,
     * strictly ascending keys and the element count.
     */
    void validate() {
        auto root_handle = header_.get().root;
        if (!root_handle) {
            if (len() != 0 || node_count() != 0) {
                throw InvariantViolation("BTreeMap: empty tree with len " +
                                         std::to_string(len()) + " and " +
                                         std::to_string(node_count()) + " nodes");
            }
            return;
        }
        if (node(*root_handle).parent) {
            throw InvariantViolation("BTreeMap: root has a parent");
        }
        std::optional<uint32_t> leaf_depth;
        const K* prev = nullptr;
        uint32_t pairs = 0;
        uint32_t nodes = 0;
        validate_node(*root_handle, 0, leaf_depth, prev, pairs, nodes);
        if (pairs != len()) {
            throw InvariantViolation("BTreeMap: header len " + std::to_string(len()) +
                                     " but tree holds " + std::to_string(pairs) + " pairs");
        }
        if (nodes != node_count()) {
            throw InvariantViolation("BTreeMap: " + std::to_string(node_count()) +
                                     " nodes stored but " + std::to_string(nodes) + " reachable");
        }
    }

private:
    BTreeMap(LazyCell<BTreeHeader> header, Stash<Node> nodes, Stash<Pair> pairs)
        : header_(std::move(header)), nodes_(std::move(nodes)), pairs_(std::move(pairs)) {}

    const Node& node(NodeHandle h) {
        const Node* n = nodes_.get(h.value);
        if (!n) {
            throw InvariantViolation("BTreeMap: dangling node handle " + std::to_string(h.value));
        }
        return *n;
    }

    Node& node_mut(NodeHandle h) {
        Node* n = nodes_.get_mut(h.value);
        if (!n) {
            throw InvariantViolation("BTreeMap: dangling node handle " + std::to_string(h.value));
        }
        return *n;
    }

    const Pair& pair(KVStorageIndex kv) {
        const Pair* p = pairs_.get(kv.value);
        if (!p) {
            throw InvariantViolation("BTreeMap: dangling pair index " + std::to_string(kv.value));
        }
        return *p;
    }

    Pair& pair_mut(KVStorageIndex kv) {
        Pair* p = pairs_.get_mut(kv.value);
        if (!p) {
            throw InvariantViolation("BTreeMap: dangling pair index " + std::to_string(kv.value));
        }
        return *p;
    }

    KVStorageIndex kv_at(Position pos) { return *node(pos.node).pairs[pos.idx]; }

    /**
     * Descends from the root. On a miss the position is the leaf and the
     * slot where the key would be inserted. nullopt for an empty tree.
     */
    std::optional<SearchResult> search(const K& key) {
        auto root_handle = header_.get().root;
        if (!root_handle) {
            return std::nullopt;
        }
        NodeHandle current = *root_handle;
        while (true) {
            const Node& n = node(current);
            uint32_t i = 0;
            for (; i < n.len; ++i) {
                const K& k = pair(*n.pairs[i]).key;
                if (compare_(key, k)) {
                    break;
                }
                if (!compare_(k, key)) {
                    return SearchResult{true, {current, i}};
                }
            }
            if (n.is_leaf()) {
                return SearchResult{false, {current, i}};
            }
            current = *n.edges[i];
        }
    }

    /// Points every child of `h` back at `h` and its slot.
    void fix_children(NodeHandle h) {
        const Node& n = node(h);
        if (n.is_leaf()) {
            return;
        }
        std::array<std::optional<NodeHandle>, btree::EDGES> edges = n.edges;
        uint32_t count = n.len + 1;
        for (uint32_t i = 0; i < count; ++i) {
            Node& child = node_mut(*edges[i]);
            if (child.parent != h || child.parent_idx != i) {
                child.parent = h;
                child.parent_idx = i;
            }
        }
    }

    KVStorageIndex insert_new(const std::optional<SearchResult>& res, K key, V value) {
        KVStorageIndex kv{pairs_.put(Pair{std::move(key), std::move(value)})};
        header_.get_mut().len += 1;
        if (!res) {
            Node root;
            root.pairs[0] = kv;
            root.len = 1;
            header_.get_mut().root = NodeHandle{nodes_.put(root)};
            return kv;
        }
        insert_at(res->pos.node, res->pos.idx, kv, std::nullopt);
        return kv;
    }

    /**
     * Inserts `kv` at pair slot `idx` of `h` and, for internal nodes,
     * `right_edge` at edge slot `idx + 1`. Splits on overflow and recurses
     * into the parent with the promoted pair.
     */
    void insert_at(NodeHandle h, uint32_t idx, KVStorageIndex kv,
                   std::optional<NodeHandle> right_edge) {
        Node& n = node_mut(h);
        if (n.len < btree::CAPACITY) {
            btree::slice_insert(n.pairs, n.len, idx, std::optional<KVStorageIndex>(kv));
            if (right_edge) {
                btree::slice_insert(n.edges, n.len + 1, idx + 1, right_edge);
            }
            n.len += 1;
            if (right_edge) {
                fix_children(h);
            }
            return;
        }

        // Overflow: lay out CAPACITY + 1 pairs and, for internal nodes,
        // EDGES + 1 edges, then cut at position B.
        std::array<std::optional<KVStorageIndex>, btree::CAPACITY + 1> pairs{};
        std::array<std::optional<NodeHandle>, btree::EDGES + 1> edges{};
        for (uint32_t i = 0; i < btree::CAPACITY; ++i) {
            pairs[i] = n.pairs[i];
        }
        btree::slice_insert(pairs, btree::CAPACITY, idx, std::optional<KVStorageIndex>(kv));
        bool internal = right_edge.has_value();
        if (internal) {
            for (uint32_t i = 0; i < btree::EDGES; ++i) {
                edges[i] = n.edges[i];
            }
            btree::slice_insert(edges, btree::EDGES, idx + 1, right_edge);
        }

        KVStorageIndex median = *pairs[btree::B];
        Node right;
        right.parent = n.parent;
        right.len = btree::CAPACITY - btree::B;
        for (uint32_t i = 0; i < right.len; ++i) {
            right.pairs[i] = pairs[btree::B + 1 + i];
        }
        if (internal) {
            for (uint32_t i = 0; i <= right.len; ++i) {
                right.edges[i] = edges[btree::B + 1 + i];
            }
        }

        n.pairs.fill(std::nullopt);
        n.edges.fill(std::nullopt);
        n.len = btree::B;
        for (uint32_t i = 0; i < btree::B; ++i) {
            n.pairs[i] = pairs[i];
        }
        if (internal) {
            for (uint32_t i = 0; i <= btree::B; ++i) {
                n.edges[i] = edges[i];
            }
        }
        std::optional<NodeHandle> parent = n.parent;
        std::optional<uint32_t> parent_idx = n.parent_idx;

        NodeHandle r{nodes_.put(std::move(right))};
        fix_children(h);
        fix_children(r);

        if (parent) {
            insert_at(*parent, *parent_idx, median, r);
            return;
        }

        Node root;
        root.pairs[0] = median;
        root.edges[0] = h;
        root.edges[1] = r;
        root.len = 1;
        NodeHandle new_root{nodes_.put(std::move(root))};
        fix_children(new_root);
        header_.get_mut().root = new_root;
        CELLAR_LOG_DEBUG("btree", "root split, new root node ", new_root.value);
    }

    /**
     * Removes the pair at `pos`, rebalancing as needed, and returns it.
     */
    Pair remove_at(Position pos) {
        KVStorageIndex removed = kv_at(pos);

        NodeHandle leaf = pos.node;
        uint32_t leaf_idx = pos.idx;
        if (!node(pos.node).is_leaf()) {
            // Replace with the in-order predecessor, the last pair of the
            // rightmost leaf of the left subtree.
            NodeHandle current = *node(pos.node).edges[pos.idx];
            while (!node(current).is_leaf()) {
                const Node& n = node(current);
                current = *n.edges[n.len];
            }
            leaf = current;
            leaf_idx = node(leaf).len - 1;
            KVStorageIndex predecessor = *node(leaf).pairs[leaf_idx];
            node_mut(pos.node).pairs[pos.idx] = predecessor;
        }

        Node& l = node_mut(leaf);
        btree::slice_remove(l.pairs, l.len, leaf_idx);
        l.len -= 1;

        uint32_t remaining = header_.get().len - 1;
        header_.get_mut().len = remaining;

        auto taken = pairs_.take(removed.value);
        if (!taken) {
            throw InvariantViolation("BTreeMap: removed pair " + std::to_string(removed.value) +
                                     " was not stored");
        }

        if (remaining == 0) {
            // nothing left to balance; drop every node and pair cell
            nodes_.clear();
            pairs_.clear();
            header_.set(BTreeHeader{});
            return std::move(*taken);
        }

        rebalance(leaf);
        return std::move(*taken);
    }

    /**
     * Restores the minimum fill of `h` and, after a merge, of its
     * ancestors. Collapses an empty internal root into its only child.
     */
    void rebalance(NodeHandle h) {
        while (true) {
            const Node& n = node(h);
            if (!n.parent) {
                if (n.len == 0 && !n.is_leaf()) {
                    NodeHandle child = *n.edges[0];
                    Node& c = node_mut(child);
                    c.parent.reset();
                    c.parent_idx.reset();
                    nodes_.remove_occupied(h.value);
                    header_.get_mut().root = child;
                    CELLAR_LOG_DEBUG("btree", "root collapsed into node ", child.value);
                }
                return;
            }
            if (n.len >= btree::MIN_LEN) {
                return;
            }

            NodeHandle parent = *n.parent;
            uint32_t parent_idx = *n.parent_idx;
            const Node& p = node(parent);
            uint32_t sep = parent_idx > 0 ? parent_idx - 1 : parent_idx;
            NodeHandle left = *p.edges[sep];
            NodeHandle right = *p.edges[sep + 1];
            uint32_t left_len = node(left).len;
            uint32_t right_len = node(right).len;

            if (left_len + right_len + 1 <= btree::CAPACITY) {
                merge(parent, sep);
                h = parent;
                continue;
            }
            if (right == h) {
                steal_left(parent, sep);
            } else {
                steal_right(parent, sep);
            }
            return;
        }
    }

    /**
     * Folds the separator `sep` of `parent` and its right child into the
     * left child, then frees the right child.
     */
    void merge(NodeHandle parent, uint32_t sep) {
        Node& p = node_mut(parent);
        NodeHandle left = *p.edges[sep];
        NodeHandle right = *p.edges[sep + 1];
        KVStorageIndex separator = *btree::slice_remove(p.pairs, p.len, sep);
        btree::slice_remove(p.edges, p.len + 1, sep + 1);
        p.len -= 1;

        Node& l = node_mut(left);
        const Node& r = node(right);
        uint32_t base = l.len;
        l.pairs[base] = separator;
        for (uint32_t i = 0; i < r.len; ++i) {
            l.pairs[base + 1 + i] = r.pairs[i];
        }
        if (!r.is_leaf()) {
            for (uint32_t i = 0; i <= r.len; ++i) {
                l.edges[base + 1 + i] = r.edges[i];
            }
        }
        l.len = base + 1 + r.len;

        nodes_.remove_occupied(right.value);
        fix_children(left);
        fix_children(parent);
    }

    /// Rotates the last pair of the left child through the parent into
    /// the front of the right child.
    void steal_left(NodeHandle parent, uint32_t sep) {
        Node& p = node_mut(parent);
        NodeHandle left = *p.edges[sep];
        NodeHandle right = *p.edges[sep + 1];
        Node& l = node_mut(left);
        Node& r = node_mut(right);

        KVStorageIndex moved = *l.pairs[l.len - 1];
        std::optional<NodeHandle> moved_edge = l.edges[l.len];
        l.pairs[l.len - 1].reset();
        l.edges[l.len].reset();
        l.len -= 1;

        btree::slice_insert(r.pairs, r.len, 0, p.pairs[sep]);
        if (moved_edge) {
            btree::slice_insert(r.edges, r.len + 1, 0, moved_edge);
        }
        r.len += 1;
        p.pairs[sep] = moved;

        if (moved_edge) {
            fix_children(right);
        }
    }

    /// Rotates the first pair of the right child through the parent onto
    /// the end of the left child.
    void steal_right(NodeHandle parent, uint32_t sep) {
        Node& p = node_mut(parent);
        NodeHandle left = *p.edges[sep];
        NodeHandle right = *p.edges[sep + 1];
        Node& l = node_mut(left);
        Node& r = node_mut(right);

        KVStorageIndex moved = *btree::slice_remove(r.pairs, r.len, 0);
        std::optional<NodeHandle> moved_edge;
        if (!r.is_leaf()) {
            moved_edge = btree::slice_remove(r.edges, r.len + 1, 0);
        }
        r.len -= 1;

        l.pairs[l.len] = p.pairs[sep];
        if (moved_edge) {
            l.edges[l.len + 1] = moved_edge;
        }
        l.len += 1;
        p.pairs[sep] = moved;

        if (moved_edge) {
            fix_children(left);
            fix_children(right);
        }
    }

    template <typename F>
    void visit(NodeHandle h, F& fn) {
        const Node n = node(h);
        for (uint32_t i = 0; i < n.len; ++i) {
            if (!n.is_leaf()) {
                visit(*n.edges[i], fn);
            }
            const Pair& kv = pair(*n.pairs[i]);
            fn(kv.key, kv.value);
        }
        if (!n.is_leaf()) {
            visit(*n.edges[n.len], fn);
        }
    }

    void validate_node(NodeHandle h, uint32_t depth, std::optional<uint32_t>& leaf_depth,
                       const K*& prev, uint32_t& pairs, uint32_t& nodes) {
        const Node n = node(h);
        ++nodes;
        std::string where = "BTreeMap: node " + std::to_string(h.value);
        if (n.len > btree::CAPACITY) {
            throw InvariantViolation(where + " overfull");
        }
        if (n.parent && n.len < btree::MIN_LEN) {
            throw InvariantViolation(where + " underfull with " + std::to_string(n.len) + " pairs");
        }
        if (!n.parent && n.len == 0) {
            throw InvariantViolation(where + " is an empty root");
        }
        for (uint32_t i = 0; i < btree::CAPACITY; ++i) {
            if (n.pairs[i].has_value() != (i < n.len)) {
                throw InvariantViolation(where + " has a pair slot mismatch at " + std::to_string(i));
            }
        }
        if (n.is_leaf()) {
            for (const auto& edge : n.edges) {
                if (edge) {
                    throw InvariantViolation(where + " is a leaf with edges");
                }
            }
            if (!leaf_depth) {
                leaf_depth = depth;
            } else if (*leaf_depth != depth) {
                throw InvariantViolation(where + " leaf at depth " + std::to_string(depth) +
                                         ", expected " + std::to_string(*leaf_depth));
            }
        } else {
            for (uint32_t i = 0; i < btree::EDGES; ++i) {
                if (n.edges[i].has_value() != (i <= n.len)) {
                    throw InvariantViolation(where + " has an edge slot mismatch at " +
                                             std::to_string(i));
                }
            }
        }

        for (uint32_t i = 0; i <= n.len; ++i) {
            if (!n.is_leaf()) {
                const Node& child = node(*n.edges[i]);
                if (child.parent != h || child.parent_idx != i) {
                    throw InvariantViolation(where + " child " + std::to_string(n.edges[i]->value) +
                                             " has a stale parent link");
                }
                validate_node(*n.edges[i], depth + 1, leaf_depth, prev, pairs, nodes);
            }
            if (i < n.len) {
                const K& key = pair(*n.pairs[i]).key;
                if (prev && !compare_(*prev, key)) {
                    throw InvariantViolation(where + " keys out of order");
                }
                prev = &key;
                ++pairs;
            }
        }
    }

    LazyCell<BTreeHeader> header_;
    Stash<Node> nodes_;
    Stash<Pair> pairs_;
    Compare compare_;
};

} // namespace cellar
