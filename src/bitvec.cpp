/**
 * @file bitvec.cpp
 * @brief Bits256 and StorageBitvec
 */

#include "bitvec.hpp"

#include <bit>
#include <limits>
#include <string>

namespace cellar {

//=============================================================================
// Bits256
//=============================================================================

bool Bits256::get(uint32_t index) const {
    return (words_[index / 64] >> (index % 64)) & 1;
}

void Bits256::set(uint32_t index, bool value) {
    uint64_t mask = 1ULL << (index % 64);
    if (value) {
        words_[index / 64] |= mask;
    } else {
        words_[index / 64] &= ~mask;
    }
}

void Bits256::flip(uint32_t index) {
    words_[index / 64] ^= 1ULL << (index % 64);
}

std::optional<uint32_t> Bits256::position_first_zero() const {
    for (uint32_t w = 0; w < WORDS; ++w) {
        if (words_[w] != std::numeric_limits<uint64_t>::max()) {
            return w * 64 + static_cast<uint32_t>(std::countr_one(words_[w]));
        }
    }
    return std::nullopt;
}

uint32_t Bits256::count_ones() const {
    uint32_t n = 0;
    for (uint64_t word : words_) {
        n += static_cast<uint32_t>(std::popcount(word));
    }
    return n;
}

bool Bits256::is_full() const {
    for (uint64_t word : words_) {
        if (word != std::numeric_limits<uint64_t>::max()) {
            return false;
        }
    }
    return true;
}

bool Bits256::is_empty() const {
    for (uint64_t word : words_) {
        if (word != 0) {
            return false;
        }
    }
    return true;
}

//=============================================================================
// StorageBitvec
//=============================================================================

StorageBitvec StorageBitvec::pull_spread(HostStorage& storage, KeyPtr& ptr) {
    auto len = LazyCell<uint32_t>::pull_spread(storage, ptr);
    auto bits = StorageVec<Bits256>::pull_spread(storage, ptr);
    return StorageBitvec(std::move(len), std::move(bits));
}

void StorageBitvec::push_spread(HostStorage& storage, KeyPtr& ptr) {
    len_.push_spread(storage, ptr);
    bits_.push_spread(storage, ptr);
}

void StorageBitvec::clear_spread(HostStorage& storage, KeyPtr& ptr) {
    len_.clear_spread(storage, ptr);
    bits_.clear_spread(storage, ptr);
}

std::optional<bool> StorageBitvec::get(uint32_t index) {
    if (index >= len()) {
        return std::nullopt;
    }
    return bits_.at(index / Bits256::BITS).get(index % Bits256::BITS);
}

void StorageBitvec::set(uint32_t index, bool value) {
    if (index >= len()) {
        throw IndexOutOfBounds("StorageBitvec: index " + std::to_string(index) +
                               " out of bounds for length " + std::to_string(len()));
    }
    Bits256& chunk = bits_.at_mut(index / Bits256::BITS);
    chunk.set(index % Bits256::BITS, value);
}

void StorageBitvec::push(bool value) {
    uint32_t n = len();
    if (n == std::numeric_limits<uint32_t>::max()) {
        throw CapacityExceeded("StorageBitvec: cannot push more than u32::MAX bits");
    }
    if (n == capacity()) {
        Bits256 chunk;
        chunk.set(0, value);
        bits_.push(chunk);
    } else if (value) {
        bits_.at_mut(n / Bits256::BITS).set(n % Bits256::BITS, true);
    }
    len_.set(n + 1);
}

std::optional<bool> StorageBitvec::pop() {
    uint32_t n = len();
    if (n == 0) {
        return std::nullopt;
    }
    uint32_t last = n - 1;
    bool value;
    if (last % Bits256::BITS == 0) {
        // last bit of its chunk: drop the chunk entirely
        std::optional<Bits256> chunk = bits_.pop();
        value = chunk && chunk->get(0);
    } else {
        Bits256& chunk = bits_.at_mut(last / Bits256::BITS);
        value = chunk.get(last % Bits256::BITS);
        if (value) {
            chunk.set(last % Bits256::BITS, false);
        }
    }
    len_.set(last);
    return value;
}

uint64_t StorageBitvec::count_ones() {
    uint64_t total = 0;
    bits_.for_each([&total](uint32_t, const Bits256& chunk) { total += chunk.count_ones(); });
    return total;
}

} // namespace cellar
