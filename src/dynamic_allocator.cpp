/**
 * @file dynamic_allocator.cpp
 * @brief Bitmap allocator with per-chunk population counts
 */

#include "dynamic_allocator.hpp"

#include <limits>
#include <string>

#include "errors.hpp"
#include "logging.hpp"

namespace cellar {

//=============================================================================
// CountFree
//=============================================================================

std::optional<uint32_t> CountFree::first_non_full() const {
    for (uint32_t chunk = 0; chunk < CHUNKS; ++chunk) {
        if (!is_full(chunk)) {
            return chunk;
        }
    }
    return std::nullopt;
}

void CountFree::increment(uint32_t chunk) {
    if (is_full(chunk)) {
        throw InvariantViolation("CountFree: increment of full chunk " + std::to_string(chunk));
    }
    if (counts[chunk] == Bits256::BITS - 1) {
        counts[chunk] = 0;
        full |= 1u << chunk;
    } else {
        ++counts[chunk];
    }
}

void CountFree::decrement(uint32_t chunk) {
    if (is_full(chunk)) {
        full &= ~(1u << chunk);
        counts[chunk] = Bits256::BITS - 1;
        return;
    }
    if (counts[chunk] == 0) {
        throw InvariantViolation("CountFree: decrement of empty chunk " + std::to_string(chunk));
    }
    --counts[chunk];
}

uint32_t CountFree::total() const {
    uint32_t n = 0;
    for (uint32_t chunk = 0; chunk < CHUNKS; ++chunk) {
        n += count(chunk);
    }
    return n;
}

//=============================================================================
// DynamicAllocator
//=============================================================================

DynamicAllocator DynamicAllocator::pull_spread(HostStorage& storage, KeyPtr& ptr) {
    auto counts = StorageVec<CountFree>::pull_spread(storage, ptr);
    auto free = StorageBitvec::pull_spread(storage, ptr);
    return DynamicAllocator(std::move(counts), std::move(free));
}

void DynamicAllocator::push_spread(HostStorage& storage, KeyPtr& ptr) {
    counts_.push_spread(storage, ptr);
    free_.push_spread(storage, ptr);
}

void DynamicAllocator::clear_spread(HostStorage& storage, KeyPtr& ptr) {
    counts_.clear_spread(storage, ptr);
    free_.clear_spread(storage, ptr);
}

DynamicAllocation DynamicAllocator::alloc() {
    uint32_t len = free_.len();
    uint32_t blocks = counts_.len();

    for (uint32_t block = 0; block < blocks; ++block) {
        auto chunk_in_block = counts_.at(block).first_non_full();
        if (!chunk_in_block) {
            continue;
        }
        uint32_t chunk = block * CountFree::CHUNKS + *chunk_in_block;
        uint32_t chunk_start = chunk * Bits256::BITS;

        // All earlier chunks are full, so the first zero of this chunk is
        // either a cleared bit inside the bitmap or exactly its end.
        uint32_t slot = len;
        if (chunk_start < len) {
            const Bits256* bits = free_.get_chunk(chunk);
            auto zero = bits ? bits->position_first_zero() : std::nullopt;
            if (!zero) {
                throw InvariantViolation("DynamicAllocator: chunk " + std::to_string(chunk) +
                                         " counted as non-full has no free bit");
            }
            slot = chunk_start + *zero;
        }
        if (slot > len) {
            throw InvariantViolation("DynamicAllocator: free slot " + std::to_string(slot) +
                                     " lies past bitmap end " + std::to_string(len));
        }

        if (slot == len) {
            free_.push(true);
        } else {
            free_.set(slot, true);
        }
        counts_.at_mut(block).increment(*chunk_in_block);
        return {slot};
    }

    // every counted chunk is full: len == blocks * 8192
    if (len == std::numeric_limits<uint32_t>::max()) {
        CELLAR_LOG_ERROR("alloc", "dynamic allocator exhausted the 32-bit slot space");
        throw CapacityExceeded("DynamicAllocator: no free slots left");
    }
    CELLAR_LOG_DEBUG("alloc", "adding count block ", blocks, " at slot ", len);
    counts_.push(CountFree{});
    free_.push(true);
    counts_.at_mut(blocks).increment(0);
    return {len};
}

void DynamicAllocator::free(DynamicAllocation allocation) {
    uint32_t slot = allocation.index;
    auto bit = free_.get(slot);
    if (!bit || !*bit) {
        CELLAR_LOG_ERROR("alloc", "double free of dynamic allocation ", slot);
        throw DoubleFree("DynamicAllocator: encountered double free of slot " +
                         std::to_string(slot));
    }
    free_.set(slot, false);
    uint32_t chunk = slot / Bits256::BITS;
    counts_.at_mut(chunk / CountFree::CHUNKS).decrement(chunk % CountFree::CHUNKS);
    trim_tail();
}

void DynamicAllocator::trim_tail() {
    uint32_t len = free_.len();
    while (len > 0 && !*free_.get(len - 1)) {
        free_.pop();
        --len;
    }
    uint64_t needed_blocks = (static_cast<uint64_t>(len) + CountFree::SLOTS - 1) / CountFree::SLOTS;
    while (counts_.len() > needed_blocks) {
        counts_.pop();
    }
}

bool DynamicAllocator::is_allocated(uint32_t index) {
    return free_.get(index).value_or(false);
}

uint64_t DynamicAllocator::count_allocated() {
    uint64_t total = 0;
    counts_.for_each([&total](uint32_t, const CountFree& block) { total += block.total(); });
    return total;
}

} // namespace cellar
