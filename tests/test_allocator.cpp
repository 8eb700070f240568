#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <random>
#include <set>
#include <vector>

#include "bitvec.hpp"
#include "dynamic_allocator.hpp"
#include "errors.hpp"
#include "memory_storage.hpp"
#include "storage_traits.hpp"

using namespace cellar;

// --- Bits256 ---

TEST(Bits256, FirstZeroAndCounts) {
    Bits256 bits;
    EXPECT_TRUE(bits.is_empty());
    EXPECT_EQ(bits.position_first_zero(), 0u);

    for (uint32_t i = 0; i < 70; ++i) {
        bits.set(i, true);
    }
    EXPECT_EQ(bits.position_first_zero(), 70u);
    EXPECT_EQ(bits.count_ones(), 70u);

    bits.flip(3);
    EXPECT_FALSE(bits.get(3));
    EXPECT_EQ(bits.position_first_zero(), 3u);

    for (uint32_t i = 0; i < Bits256::BITS; ++i) {
        bits.set(i, true);
    }
    EXPECT_TRUE(bits.is_full());
    EXPECT_FALSE(bits.position_first_zero().has_value());
}

// --- StorageBitvec ---

TEST(StorageBitvec, PushPopAcrossChunks) {
    MemoryStorage host;
    Key root;
    StorageBitvec bv;
    for (uint32_t i = 0; i < 300; ++i) {
        bv.push(i % 3 == 0);
    }
    EXPECT_EQ(bv.len(), 300u);
    EXPECT_EQ(bv.chunk_count(), 2u);
    EXPECT_EQ(bv.capacity(), 512u);
    EXPECT_EQ(bv.count_ones(), 100u);
    EXPECT_EQ(bv.get(255), true);
    EXPECT_EQ(bv.get(256), false);
    EXPECT_FALSE(bv.get(300).has_value());

    push_spread_root(bv, host, root);
    auto pulled = pull_spread_root<StorageBitvec>(host, root);
    EXPECT_EQ(pulled.len(), 300u);
    EXPECT_EQ(pulled.get(297), true);

    for (uint32_t i = 0; i < 44; ++i) {
        pulled.pop();
    }
    EXPECT_EQ(pulled.len(), 256u);
    EXPECT_EQ(pulled.chunk_count(), 1u);
    pulled.set(10, true);
    pulled.reset(0);
    EXPECT_EQ(pulled.get(10), true);
    EXPECT_EQ(pulled.get(0), false);
    EXPECT_THROW(pulled.set(256, true), IndexOutOfBounds);
}

// --- DynamicAllocator ---

class AllocatorTest : public ::testing::Test {
protected:
    MemoryStorage host;
    Key root = Key::filled(0x42);
    DynamicAllocator allocator;
};

TEST_F(AllocatorTest, ReusesFreedSlot) {
    EXPECT_EQ(allocator.alloc().index, 0u);
    EXPECT_EQ(allocator.alloc().index, 1u);
    allocator.free({0});
    EXPECT_FALSE(allocator.is_allocated(0));
    EXPECT_EQ(allocator.alloc().index, 0u);
    EXPECT_EQ(allocator.count_allocated(), 2u);
}

TEST_F(AllocatorTest, DoubleFreeThrows) {
    allocator.alloc();
    allocator.alloc();
    allocator.free({0});
    EXPECT_THROW(allocator.free({0}), DoubleFree);
    EXPECT_THROW(allocator.free({12345}), DoubleFree);
}

TEST_F(AllocatorTest, AllocThenFreeRestoresState) {
    for (int i = 0; i < 10; ++i) {
        allocator.alloc();
    }
    allocator.free({4});
    push_spread_root(allocator, host, root);
    auto before = host.to_json();

    DynamicAllocation a = allocator.alloc();
    EXPECT_EQ(a.index, 4u);
    allocator.free(a);
    DynamicAllocation b = allocator.alloc();
    EXPECT_EQ(b.index, 10u);
    allocator.free(b);
    EXPECT_EQ(allocator.len(), 10u);

    push_spread_root(allocator, host, root);
    EXPECT_EQ(host.to_json(), before);
}

TEST_F(AllocatorTest, GrowsAcrossCountBlocks) {
    const uint32_t total = CountFree::SLOTS + 300;
    for (uint32_t i = 0; i < total; ++i) {
        ASSERT_EQ(allocator.alloc().index, i);
    }
    EXPECT_EQ(allocator.count_allocated(), total);

    allocator.free({257});
    allocator.free({CountFree::SLOTS + 5});
    EXPECT_EQ(allocator.alloc().index, 257u);
    EXPECT_EQ(allocator.alloc().index, CountFree::SLOTS + 5);
    EXPECT_EQ(allocator.alloc().index, total);

    push_spread_root(allocator, host, root);
    auto pulled = pull_spread_root<DynamicAllocator>(host, root);
    EXPECT_EQ(pulled.count_allocated(), total + 1);
    pulled.free({100});
    EXPECT_EQ(pulled.alloc().index, 100u);
}

TEST_F(AllocatorTest, RandomAllocFreeKeepsSlotsUnique) {
    std::mt19937 rng(7);
    std::set<uint32_t> live;
    for (int step = 0; step < 3000; ++step) {
        if (live.empty() || rng() % 3 != 0) {
            uint32_t slot = allocator.alloc().index;
            ASSERT_TRUE(live.insert(slot).second) << "slot " << slot << " handed out twice";
            // first fit: no free slot below the one returned
            for (uint32_t i = 0; i < slot; ++i) {
                if (!live.count(i)) {
                    FAIL() << "slot " << i << " was free below " << slot;
                }
            }
        } else {
            auto it = live.begin();
            std::advance(it, rng() % live.size());
            allocator.free({*it});
            live.erase(it);
        }
    }
    EXPECT_EQ(allocator.count_allocated(), live.size());
    for (uint32_t slot : live) {
        EXPECT_TRUE(allocator.is_allocated(slot));
    }
}

TEST(DynamicAllocation, KeyRegions) {
    Key base;
    DynamicAllocation a{3};
    EXPECT_EQ(a.key(base), base + (uint64_t{3} << 32));
    EXPECT_FALSE((DynamicAllocation{1}.key(base) - a.key(base)).try_to_u64().has_value());
    EXPECT_EQ((a.key(base) - DynamicAllocation{2}.key(base)).try_to_u64(), uint64_t{1} << 32);
}
