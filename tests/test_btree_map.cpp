#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <map>
#include <random>
#include <string>
#include <vector>

#include "btree_map.hpp"
#include "errors.hpp"
#include "memory_storage.hpp"
#include "storage_traits.hpp"

using namespace cellar;

class BTreeMapTest : public ::testing::Test {
protected:
    MemoryStorage host;
    Key root = Key::filled(0x42);
};

TEST_F(BTreeMapTest, EmptyMap) {
    BTreeMap<uint32_t, uint32_t> map;
    EXPECT_TRUE(map.is_empty());
    EXPECT_EQ(map.get(1), nullptr);
    EXPECT_FALSE(map.remove(1).has_value());
    EXPECT_FALSE(map.root().has_value());
    EXPECT_NO_THROW(map.validate());
}

TEST_F(BTreeMapTest, InsertReplacesAndReturnsOldValue) {
    BTreeMap<uint32_t, std::string> map;
    EXPECT_FALSE(map.insert(3, "three").has_value());
    EXPECT_EQ(map.insert(3, "THREE"), "three");
    EXPECT_EQ(map.len(), 1u);
    EXPECT_EQ(*map.get(3), "THREE");

    *map.get_mut(3) += "!";
    const auto* kv = map.get_key_value(3);
    ASSERT_NE(kv, nullptr);
    EXPECT_EQ(kv->key, 3u);
    EXPECT_EQ(kv->value, "THREE!");
    EXPECT_TRUE(map.contains_key(3));
    EXPECT_FALSE(map.contains_key(4));
}

TEST_F(BTreeMapTest, RootSplitsWhenFull) {
    BTreeMap<uint32_t, uint32_t> map;
    for (uint32_t k = 0; k < btree::CAPACITY; ++k) {
        map.insert(k, k * 2);
    }
    EXPECT_EQ(map.node_count(), 1u);
    EXPECT_EQ(map.len(), 11u);

    map.insert(11, 22);
    EXPECT_EQ(map.node_count(), 3u);
    EXPECT_EQ(map.len(), 12u);
    map.validate();

    const Node* top = map.get_node(*map.root());
    ASSERT_NE(top, nullptr);
    EXPECT_EQ(top->len, 1u);
    EXPECT_FALSE(top->is_leaf());
    EXPECT_EQ(map.get_node(*top->edges[0])->len, btree::B);
    EXPECT_EQ(map.get_node(*top->edges[1])->len, btree::CAPACITY - btree::B);

    EXPECT_EQ(map.remove(11), 22u);
    EXPECT_EQ(map.node_count(), 1u);
    EXPECT_EQ(map.len(), 11u);
    EXPECT_TRUE(map.get_node(*map.root())->is_leaf());
    map.validate();
}

TEST_F(BTreeMapTest, KeysAreVisitedInOrder) {
    BTreeMap<int32_t, int32_t> map;
    std::vector<int32_t> expected;
    for (int32_t k = 200; k > -200; k -= 7) {
        map.insert(k, -k);
        expected.insert(expected.begin(), k);
    }
    EXPECT_EQ(map.keys(), expected);

    int64_t sum = 0;
    map.for_each([&sum](const int32_t& k, const int32_t& v) {
        EXPECT_EQ(k, -v);
        sum += v;
    });
    int64_t expected_sum = 0;
    for (int32_t k : expected) {
        expected_sum -= k;
    }
    EXPECT_EQ(sum, expected_sum);
}

TEST_F(BTreeMapTest, RandomOperationsMatchStdMap) {
    BTreeMap<uint32_t, uint64_t> map;
    std::map<uint32_t, uint64_t> model;
    std::mt19937 rng(1234);

    for (int step = 0; step < 4000; ++step) {
        uint32_t key = rng() % 500;
        if (rng() % 3 != 0) {
            uint64_t value = rng();
            auto old = map.insert(key, value);
            auto it = model.find(key);
            if (it == model.end()) {
                EXPECT_FALSE(old.has_value());
            } else {
                EXPECT_EQ(old, it->second);
            }
            model[key] = value;
        } else {
            auto removed = map.remove(key);
            auto it = model.find(key);
            if (it == model.end()) {
                EXPECT_FALSE(removed.has_value());
            } else {
                EXPECT_EQ(removed, it->second);
                model.erase(it);
            }
        }
        if (step % 250 == 0) {
            ASSERT_NO_THROW(map.validate());
        }
    }

    map.validate();
    EXPECT_EQ(map.len(), model.size());
    std::vector<uint32_t> model_keys;
    for (const auto& [k, v] : model) {
        model_keys.push_back(k);
        ASSERT_NE(map.get(k), nullptr);
        EXPECT_EQ(*map.get(k), v);
    }
    EXPECT_EQ(map.keys(), model_keys);
}

TEST_F(BTreeMapTest, RemovingEverythingLeavesOnlyHeaderCells) {
    BTreeMap<uint32_t, uint32_t> map;
    push_spread_root(map, host, root);
    size_t empty_cells = host.cell_count();

    std::vector<uint32_t> keys;
    for (uint32_t k = 0; k < 300; ++k) {
        keys.push_back(k * 37 % 1009);
        map.insert(keys.back(), k);
    }
    push_spread_root(map, host, root);
    EXPECT_GT(host.cell_count(), empty_cells);

    auto pulled = pull_spread_root<BTreeMap<uint32_t, uint32_t>>(host, root);
    EXPECT_EQ(pulled.len(), 300u);
    std::shuffle(keys.begin(), keys.end(), std::mt19937(9));
    for (uint32_t k : keys) {
        ASSERT_TRUE(pulled.remove(k).has_value());
    }
    EXPECT_TRUE(pulled.is_empty());
    EXPECT_EQ(pulled.node_count(), 0u);
    pulled.validate();

    push_spread_root(pulled, host, root);
    // map header plus the node and pair stash headers
    EXPECT_EQ(empty_cells, 3u);
    EXPECT_EQ(host.cell_count(), empty_cells);
}

TEST_F(BTreeMapTest, SurvivesFlushAndReload) {
    {
        BTreeMap<std::string, uint32_t> map;
        for (uint32_t i = 0; i < 100; ++i) {
            map.insert("key-" + std::to_string(i), i);
        }
        push_spread_root(map, host, root);
    }

    auto map = pull_spread_root<BTreeMap<std::string, uint32_t>>(host, root);
    EXPECT_EQ(map.len(), 100u);
    map.validate();
    EXPECT_EQ(*map.get("key-42"), 42u);
    EXPECT_EQ(map.get("key-100"), nullptr);

    map.remove("key-42");
    map.insert("key-100", 100);
    push_spread_root(map, host, root);

    auto again = pull_spread_root<BTreeMap<std::string, uint32_t>>(host, root);
    EXPECT_FALSE(again.contains_key("key-42"));
    EXPECT_EQ(*again.get("key-100"), 100u);
    again.validate();
}

TEST_F(BTreeMapTest, ClearDropsEveryPair) {
    BTreeMap<uint32_t, uint32_t> map;
    push_spread_root(map, host, root);
    size_t empty_cells = host.cell_count();
    for (uint32_t k = 0; k < 50; ++k) {
        map.insert(k, k);
    }
    push_spread_root(map, host, root);

    map.clear();
    EXPECT_TRUE(map.is_empty());
    map.validate();
    push_spread_root(map, host, root);
    EXPECT_EQ(host.cell_count(), empty_cells);

    clear_spread_root(map, host, root);
    EXPECT_EQ(host.cell_count(), 0u);
}

TEST_F(BTreeMapTest, EntryApi) {
    BTreeMap<std::string, uint32_t> map;

    auto vacant = map.entry("a");
    EXPECT_FALSE(vacant.is_occupied());
    EXPECT_EQ(vacant.key(), "a");
    EXPECT_EQ(vacant.or_insert(1), 1u);

    map.entry("a").and_modify([](uint32_t& v) { v += 10; }).or_insert(0);
    EXPECT_EQ(*map.get("a"), 11u);

    map.entry("b").and_modify([](uint32_t& v) { v += 10; }).or_insert(5);
    EXPECT_EQ(*map.get("b"), 5u);

    uint32_t& c = map.entry("c").or_insert_with([] { return 7u; });
    c *= 2;
    EXPECT_EQ(*map.get("c"), 14u);

    auto occupied = map.entry("b");
    ASSERT_TRUE(occupied.is_occupied());
    EXPECT_EQ(occupied.occupied()->get(), 5u);
    EXPECT_EQ(occupied.occupied()->insert(6), 5u);
    EXPECT_EQ(occupied.occupied()->remove(), 6u);
    EXPECT_FALSE(map.contains_key("b"));
    EXPECT_EQ(map.len(), 2u);
    map.validate();
}

TEST_F(BTreeMapTest, EntryRemovalRebalances) {
    BTreeMap<uint32_t, uint32_t> map;
    for (uint32_t k = 0; k < 200; ++k) {
        map.insert(k, k);
    }
    for (uint32_t k = 0; k < 200; k += 2) {
        auto e = map.entry(k);
        ASSERT_TRUE(e.is_occupied());
        EXPECT_EQ(e.occupied()->remove_entry().key, k);
    }
    map.validate();
    EXPECT_EQ(map.len(), 100u);
    for (uint32_t k = 0; k < 200; ++k) {
        EXPECT_EQ(map.contains_key(k), k % 2 == 1);
    }
}

TEST_F(BTreeMapTest, NodeCellsUseTheNodeCodec) {
    Node node;
    node.parent = NodeHandle{4};
    node.parent_idx = 2;
    node.pairs[0] = KVStorageIndex{9};
    node.pairs[1] = KVStorageIndex{3};
    node.edges[0] = NodeHandle{1};
    node.edges[1] = NodeHandle{2};
    node.edges[2] = NodeHandle{5};
    node.len = 2;

    Node back = decode<Node>(encode(node));
    EXPECT_EQ(back.len, 2u);
    EXPECT_EQ(back.parent, NodeHandle{4});
    EXPECT_EQ(back.parent_idx, 2u);
    EXPECT_EQ(back.pairs[1], KVStorageIndex{3});
    EXPECT_FALSE(back.pairs[2].has_value());
    EXPECT_EQ(back.edges[2], NodeHandle{5});
    EXPECT_FALSE(back.edges[3].has_value());
    EXPECT_FALSE(back.is_leaf());
}
