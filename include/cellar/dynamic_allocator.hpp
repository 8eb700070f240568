/**
 * @file dynamic_allocator.hpp
 * @brief First-fit allocator for dynamically sized storage regions
 *
 * Allocation state is a bitmap (`free`, a set bit marks a live
 * allocation) plus a coarse index (`counts`) holding, for every 256-bit
 * chunk of the bitmap, the number of set bits. One CountFree covers 32
 * chunks, i.e. 8192 slots. The search scans CountFree blocks for the first
 * chunk that is not full and then scans only that chunk.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>

#include "bitvec.hpp"
#include "codec.hpp"
#include "storage_vec.hpp"

namespace cellar {

/**
 * Handle to one allocated slot. Each slot owns a 2^32-cell key region.
 */
struct DynamicAllocation {
    uint32_t index = 0;

    static constexpr u128 REGION_SIZE = static_cast<u128>(1) << 32;

    Key key(const Key& base) const { return base + static_cast<u128>(index) * REGION_SIZE; }

    friend bool operator==(const DynamicAllocation& a, const DynamicAllocation& b) {
        return a.index == b.index;
    }
    friend bool operator!=(const DynamicAllocation& a, const DynamicAllocation& b) {
        return a.index != b.index;
    }
};

template <>
struct Codec<DynamicAllocation> {
    static void encode(Encoder& enc, const DynamicAllocation& a) { encode_to(enc, a.index); }
    static DynamicAllocation decode(Decoder& dec) { return {decode_from<uint32_t>(dec)}; }
};

/**
 * Set-bit counters for 32 consecutive 256-bit chunks.
 *
 * A u8 cannot hold 256, so a full chunk is flagged in `full` and its
 * counter is kept at zero.
 */
struct CountFree {
    static constexpr uint32_t CHUNKS = 32;
    static constexpr uint32_t SLOTS = CHUNKS * Bits256::BITS;

    std::array<uint8_t, CHUNKS> counts{};
    uint32_t full = 0;

    bool is_full(uint32_t chunk) const { return (full >> chunk) & 1; }
    uint32_t count(uint32_t chunk) const { return is_full(chunk) ? Bits256::BITS : counts[chunk]; }

    /// First chunk with a free slot, or nullopt if all 32 are full.
    std::optional<uint32_t> first_non_full() const;

    void increment(uint32_t chunk);
    void decrement(uint32_t chunk);

    uint32_t total() const;
};

template <>
struct Codec<CountFree> {
    static void encode(Encoder& enc, const CountFree& c) {
        encode_to(enc, c.counts);
        encode_to(enc, c.full);
    }

    static CountFree decode(Decoder& dec) {
        CountFree c;
        c.counts = decode_from<std::array<uint8_t, CountFree::CHUNKS>>(dec);
        c.full = decode_from<uint32_t>(dec);
        return c;
    }
};

class DynamicAllocator {
public:
    static constexpr uint64_t FOOTPRINT =
        footprint_v<StorageVec<CountFree>> + footprint_v<StorageBitvec>;

    DynamicAllocator() = default;

    static DynamicAllocator pull_spread(HostStorage& storage, KeyPtr& ptr);
    void push_spread(HostStorage& storage, KeyPtr& ptr);
    void clear_spread(HostStorage& storage, KeyPtr& ptr);

    /**
     * Returns the lowest free slot, growing the bitmap if every slot
     * below its length is taken.
     */
    DynamicAllocation alloc();

    /**
     * Releases a slot. Throws DoubleFree if it is not allocated. Trailing
     * free slots are trimmed so that alloc() followed by free() leaves the
     * allocator as it was.
     */
    void free(DynamicAllocation allocation);

    bool is_allocated(uint32_t index);

    /// Length of the bitmap: one past the highest allocated slot.
    uint32_t len() { return free_.len(); }

    uint64_t count_allocated();

private:
    DynamicAllocator(StorageVec<CountFree> counts, StorageBitvec free)
        : counts_(std::move(counts)), free_(std::move(free)) {}

    void trim_tail();

    StorageVec<CountFree> counts_;
    StorageBitvec free_;
};

} // namespace cellar
