#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>

#include "entry.hpp"
#include "errors.hpp"
#include "hashing.hpp"
#include "lazy_array.hpp"
#include "lazy_cell.hpp"
#include "lazy_chunk.hpp"
#include "lazy_hash_map.hpp"
#include "lazy_index_map.hpp"
#include "memory_storage.hpp"
#include "storage_traits.hpp"
#include "storage_vec.hpp"

using namespace cellar;

class LazyTest : public ::testing::Test {
protected:
    MemoryStorage host;
    Key root = Key() + uint32_t{0x100};
};

// --- MemoryStorage ---

TEST_F(LazyTest, MemoryStorageCountsTraffic) {
    host.set_journal(true);
    Bytes value{1, 2, 3};
    host.store(root, value);
    EXPECT_EQ(host.load(root), value);
    EXPECT_FALSE(host.load(root + uint32_t{1}).has_value());
    host.clear(root);

    EXPECT_EQ(host.stats().writes, 1u);
    EXPECT_EQ(host.stats().reads, 2u);
    EXPECT_EQ(host.stats().clears, 1u);
    ASSERT_EQ(host.journal().size(), 2u);
    EXPECT_EQ(host.journal()[1].second, CellOp::Clear);
    EXPECT_EQ(host.mutations_of(root), 2u);
    EXPECT_EQ(host.cell_count(), 0u);

    host.reset_stats();
    EXPECT_EQ(host.stats().mutations(), 0u);
    EXPECT_TRUE(host.journal().empty());
}

TEST_F(LazyTest, MemoryStorageJournalIsOffByDefault) {
    EXPECT_FALSE(host.journal_enabled());
    for (uint32_t i = 0; i < 100; ++i) {
        host.store(root + i, Bytes{1});
        host.clear(root + i);
    }
    EXPECT_TRUE(host.journal().empty());
    EXPECT_EQ(host.mutations_of(root), 0u);
    EXPECT_EQ(host.stats().mutations(), 200u);

    host.set_journal(true);
    host.store(root, Bytes{2});
    EXPECT_EQ(host.journal().size(), 1u);
    host.set_journal(false);
    host.clear(root);
    EXPECT_EQ(host.journal().size(), 1u);
}

TEST_F(LazyTest, MemoryStorageJsonDump) {
    host.store(root, Bytes{0xAB, 0x01});
    auto dump = host.to_json();
    ASSERT_TRUE(dump.contains(root.to_string()));
    EXPECT_EQ(dump[root.to_string()], "ab01");
    EXPECT_FALSE(host.peek(root + uint32_t{1}).has_value());
    EXPECT_EQ(host.stats().reads, 0u);
}

// --- Entry ---

TEST(EntryState, PutDirtiesUnlessNoneOverNone) {
    Entry<uint32_t> entry(std::nullopt, EntryState::Preserved);
    EXPECT_FALSE(entry.put(std::nullopt).has_value());
    EXPECT_FALSE(entry.is_mutated());

    entry.put(5u);
    EXPECT_TRUE(entry.is_mutated());
    entry.set_state(EntryState::Preserved);

    EXPECT_EQ(entry.put(std::nullopt), 5u);
    EXPECT_TRUE(entry.is_mutated());
}

TEST(EntryState, ValueMutDirtiesOnlyWithValue) {
    Entry<uint32_t> empty(std::nullopt, EntryState::Preserved);
    empty.value_mut();
    EXPECT_FALSE(empty.is_mutated());

    Entry<uint32_t> full(3u, EntryState::Preserved);
    *full.value_mut() = 4;
    EXPECT_TRUE(full.is_mutated());
}

TEST(EntryState, TakeValueNeverCleansADirtyEntry) {
    Entry<uint32_t> entry(std::nullopt, EntryState::Mutated);
    EXPECT_FALSE(entry.take_value().has_value());
    EXPECT_TRUE(entry.is_mutated());

    Entry<uint32_t> loaded(9u, EntryState::Preserved);
    EXPECT_EQ(loaded.take_value(), 9u);
    EXPECT_TRUE(loaded.is_mutated());
    EXPECT_FALSE(loaded.value().has_value());
}

TEST_F(LazyTest, EntryFlushesOnlyWhenMutated) {
    Entry<uint32_t> entry(7u, EntryState::Preserved);
    EXPECT_FALSE(entry.push_packed_root(host, root));
    EXPECT_EQ(host.stats().mutations(), 0u);

    *entry.value_mut() = 8;
    EXPECT_TRUE(entry.push_packed_root(host, root));
    EXPECT_FALSE(entry.is_mutated());
    EXPECT_EQ(pull_packed_root<uint32_t>(host, root), 8u);

    entry.take_value();
    entry.push_packed_root(host, root);
    EXPECT_FALSE(host.contains(root));
}

// --- LazyChunk ---

TEST_F(LazyTest, ChunkFlushesOnlyMutatedEntries) {
    host.set_journal(true);
    LazyChunk<uint32_t> chunk;
    chunk.put(0, 10u);
    chunk.put(5, 50u);
    push_spread_root(chunk, host, root);
    EXPECT_EQ(host.stats().writes, 2u);
    EXPECT_TRUE(host.contains(root + uint32_t{5}));
    host.reset_stats();

    auto pulled = pull_spread_root<LazyChunk<uint32_t>>(host, root);
    EXPECT_EQ(host.stats().reads, 0u);
    ASSERT_NE(pulled.get(5), nullptr);
    EXPECT_EQ(*pulled.get(5), 50u);
    EXPECT_EQ(pulled.get(3), nullptr);
    EXPECT_EQ(host.stats().reads, 2u);

    *pulled.get_mut(5) = 55;
    push_spread_root(pulled, host, root);
    EXPECT_EQ(host.stats().mutations(), 1u);
    EXPECT_EQ(host.mutations_of(root + uint32_t{5}), 1u);

    host.reset_stats();
    push_spread_root(pulled, host, root);
    EXPECT_EQ(host.stats().mutations(), 0u);
}

TEST_F(LazyTest, ChunkTakeClearsCell) {
    LazyChunk<uint32_t> chunk;
    chunk.put(0, 10u);
    push_spread_root(chunk, host, root);

    auto pulled = pull_spread_root<LazyChunk<uint32_t>>(host, root);
    EXPECT_EQ(pulled.take(0), 10u);
    EXPECT_FALSE(pulled.take(0).has_value());
    EXPECT_EQ(pulled.cached_count(), 1u);
    host.reset_stats();
    push_spread_root(pulled, host, root);
    EXPECT_EQ(host.stats().clears, 1u);
    EXPECT_FALSE(host.contains(root));
}

TEST_F(LazyTest, ChunkPutIsAPureWrite) {
    LazyChunk<uint32_t> chunk;
    push_spread_root(chunk, host, root);
    host.reset_stats();

    chunk.put(7, 70u);
    EXPECT_EQ(host.stats().reads, 0u);
    EXPECT_FALSE(chunk.put_get(8, 80u).has_value());
    EXPECT_EQ(host.stats().reads, 1u);
    EXPECT_EQ(chunk.put_get(7, 71u), 70u);
    EXPECT_EQ(host.stats().reads, 1u);
}

TEST_F(LazyTest, ChunkSwap) {
    LazyChunk<uint32_t> chunk;
    chunk.put(1, 100u);
    push_spread_root(chunk, host, root);
    auto pulled = pull_spread_root<LazyChunk<uint32_t>>(host, root);

    pulled.swap(2, 3);
    EXPECT_EQ(pulled.mutated_count(), 0u);

    pulled.swap(1, 2);
    EXPECT_EQ(pulled.mutated_count(), 2u);
    EXPECT_EQ(pulled.get(1), nullptr);
    EXPECT_EQ(*pulled.get(2), 100u);

    host.reset_stats();
    push_spread_root(pulled, host, root);
    EXPECT_EQ(host.stats().writes, 1u);
    EXPECT_EQ(host.stats().clears, 1u);
}

TEST_F(LazyTest, ChunkKeysScaleWithElementFootprint) {
    LazyChunk<StorageVec<uint32_t>> chunk;
    StorageVec<uint32_t> vec;
    vec.push(7);
    chunk.put(1, std::move(vec));
    push_spread_root(chunk, host, root);

    Key element_root = root + (uint64_t{1} + (uint64_t{1} << 32));
    EXPECT_EQ(chunk.key_at(1), element_root);
    EXPECT_TRUE(host.contains(element_root));

    auto pulled = pull_spread_root<LazyChunk<StorageVec<uint32_t>>>(host, root);
    EXPECT_EQ(pulled.get(0), nullptr);
    StorageVec<uint32_t>* loaded = pulled.get_mut(1);
    ASSERT_NE(loaded, nullptr);
    EXPECT_EQ(loaded->len(), 1u);
    EXPECT_EQ(loaded->at(0), 7u);
}

TEST_F(LazyTest, SpreadElementRootCellIsReadOnce) {
    {
        LazyChunk<StorageVec<uint32_t>> chunk;
        StorageVec<uint32_t> vec;
        vec.push(7);
        vec.push(8);
        chunk.put(2, std::move(vec));
        push_spread_root(chunk, host, root);
    }
    host.reset_stats();

    auto pulled = pull_spread_root<LazyChunk<StorageVec<uint32_t>>>(host, root);
    StorageVec<uint32_t>* loaded = pulled.get_mut(2);
    ASSERT_NE(loaded, nullptr);
    EXPECT_EQ(host.stats().reads, 1u);
    EXPECT_EQ(loaded->len(), 2u);
    EXPECT_EQ(host.stats().reads, 1u);
    EXPECT_EQ(loaded->at(1), 8u);
    EXPECT_EQ(host.stats().reads, 2u);

    EXPECT_EQ(pulled.get(3), nullptr);
    EXPECT_EQ(host.stats().reads, 3u);
}

TEST(KeyPtrPreload, ConsumedOnlyAtItsKey) {
    Key base = Key::filled(0x10);
    KeyPtr ptr(base);
    ptr.preload(Bytes{1, 2});
    EXPECT_FALSE(ptr.take_preloaded(base + uint32_t{1}).has_value());
    auto bytes = ptr.take_preloaded(base);
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(*bytes, (Bytes{1, 2}));
    EXPECT_FALSE(ptr.take_preloaded(base).has_value());
}

TEST_F(LazyTest, UnboundChunkCannotLoad) {
    LazyChunk<uint32_t> chunk;
    EXPECT_FALSE(chunk.key().has_value());
    EXPECT_THROW(chunk.get(0), UninitializedAccess);

    chunk.put(0, 1u);
    EXPECT_EQ(*chunk.get(0), 1u);
}

TEST_F(LazyTest, PushToAnotherKeyIsALayoutMismatch) {
    LazyChunk<uint32_t> chunk;
    push_spread_root(chunk, host, root);
    EXPECT_THROW(push_spread_root(chunk, host, root + uint32_t{1}), LayoutMismatch);
}

TEST_F(LazyTest, CorruptedCellFailsToDecode) {
    host.store(root, Bytes{1, 2});
    auto chunk = pull_spread_root<LazyChunk<uint32_t>>(host, root);
    EXPECT_THROW(chunk.get(0), DecodeError);
}

TEST_F(LazyTest, ClearSpreadClearsCachedCells) {
    LazyChunk<uint32_t> chunk;
    chunk.put(0, 1u);
    chunk.put(1, 2u);
    push_spread_root(chunk, host, root);
    clear_spread_root(chunk, host, root);
    EXPECT_EQ(host.cell_count(), 0u);
    EXPECT_EQ(chunk.get(0), nullptr);
}

// --- LazyArray ---

TEST_F(LazyTest, ArrayBoundsChecks) {
    using Array = LazyArray<uint32_t, 4>;
    EXPECT_EQ(Array::FOOTPRINT, 4u);

    Array array;
    push_spread_root(array, host, root);
    EXPECT_EQ(array.get(4), nullptr);
    EXPECT_EQ(array.get_mut(9), nullptr);
    EXPECT_FALSE(array.take(4).has_value());
    EXPECT_FALSE(array.key_at(4).has_value());
    EXPECT_THROW(array.put(4, 1u), IndexOutOfBounds);
    EXPECT_THROW(array.at(4), IndexOutOfBounds);
    EXPECT_THROW(array.at(1), IndexOutOfBounds);

    array.put(1, 11u);
    array[1] += 1;
    EXPECT_EQ(array.at(1), 12u);
    push_spread_root(array, host, root);

    auto pulled = pull_spread_root<Array>(host, root);
    EXPECT_EQ(pulled.at(1), 12u);
    EXPECT_EQ(pulled.key_at(3), root + uint32_t{3});
}

// --- LazyIndexMap ---

TEST_F(LazyTest, IndexMapKeysAreOffsets) {
    LazyIndexMap<std::string> map;
    map.put(3, std::string("three"));
    push_spread_root(map, host, root);
    EXPECT_TRUE(host.contains(root + uint32_t{3}));

    auto pulled = pull_spread_root<LazyIndexMap<std::string>>(host, root);
    ASSERT_NE(pulled.get(3), nullptr);
    EXPECT_EQ(*pulled.get(3), "three");

    pulled.clear_packed_at(3);
    EXPECT_FALSE(host.contains(root + uint32_t{3}));
    EXPECT_EQ(pulled.get(3), nullptr);
    EXPECT_EQ(pulled.mutated_count(), 0u);
}

// --- LazyHashMap ---

TEST_F(LazyTest, HashMapKeysAreHashed) {
    LazyHashMap<std::string, uint32_t> map;
    map.put(std::string("alice"), 1u);
    push_spread_root(map, host, root);

    Key expected = HashBuilder<Sha2x256>().update(root).update(std::string("alice")).finish();
    EXPECT_EQ(map.key_at(std::string("alice")), expected);
    EXPECT_TRUE(host.contains(expected));

    auto pulled = pull_spread_root<LazyHashMap<std::string, uint32_t>>(host, root);
    ASSERT_NE(pulled.get(std::string("alice")), nullptr);
    EXPECT_EQ(*pulled.get(std::string("alice")), 1u);
    EXPECT_EQ(pulled.get(std::string("bob")), nullptr);
}

TEST_F(LazyTest, HashMapHasherIsSelectable) {
    LazyHashMap<uint32_t, uint32_t, Sha3x256> map;
    map.put(1u, 2u);
    push_spread_root(map, host, root);
    EXPECT_EQ(map.key_at(1u), HashBuilder<Sha3x256>().update(root).update(uint32_t{1}).finish());
}

// --- LazyCell ---

TEST_F(LazyTest, CellLoadsOnFirstAccess) {
    LazyCell<uint64_t> cell(5u);
    push_spread_root(cell, host, root);
    EXPECT_EQ(host.stats().writes, 1u);
    host.reset_stats();

    auto pulled = pull_spread_root<LazyCell<uint64_t>>(host, root);
    EXPECT_FALSE(pulled.is_cached());
    EXPECT_EQ(pulled.get(), 5u);
    EXPECT_EQ(host.stats().reads, 1u);

    push_spread_root(pulled, host, root);
    EXPECT_EQ(host.stats().writes, 0u);

    pulled.get_mut() = 6;
    push_spread_root(pulled, host, root);
    EXPECT_EQ(host.stats().writes, 1u);
    EXPECT_EQ(pull_packed_root<uint64_t>(host, root), 6u);
}

TEST_F(LazyTest, CellFailures) {
    LazyCell<uint64_t> unbound;
    EXPECT_THROW(unbound.get(), UninitializedAccess);

    auto missing = pull_spread_root<LazyCell<uint64_t>>(host, root);
    EXPECT_THROW(missing.get(), DecodeError);
}
