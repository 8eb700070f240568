/**
 * @file bitvec.hpp
 * @brief 256-bit blocks and a storage bit vector built from them
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <utility>

#include "codec.hpp"
#include "lazy_cell.hpp"
#include "storage_vec.hpp"

namespace cellar {

//=============================================================================
// Bits256
//=============================================================================

/**
 * 256 bits packed into four 64-bit words; bit i is bit (i % 64) of word
 * i / 64.
 */
class Bits256 {
public:
    static constexpr uint32_t BITS = 256;
    static constexpr uint32_t WORDS = 4;

    Bits256() : words_{} {}

    bool get(uint32_t index) const;
    void set(uint32_t index, bool value);
    void flip(uint32_t index);

    /// Index of the lowest unset bit, or nullopt if all bits are set.
    std::optional<uint32_t> position_first_zero() const;

    uint32_t count_ones() const;
    bool is_full() const;
    bool is_empty() const;

    const std::array<uint64_t, WORDS>& words() const { return words_; }
    std::array<uint64_t, WORDS>& words_mut() { return words_; }

    friend bool operator==(const Bits256& a, const Bits256& b) { return a.words_ == b.words_; }
    friend bool operator!=(const Bits256& a, const Bits256& b) { return a.words_ != b.words_; }

private:
    std::array<uint64_t, WORDS> words_;
};

template <>
struct Codec<Bits256> {
    static void encode(Encoder& enc, const Bits256& bits) { encode_to(enc, bits.words()); }

    static Bits256 decode(Decoder& dec) {
        Bits256 bits;
        bits.words_mut() = decode_from<std::array<uint64_t, Bits256::WORDS>>(dec);
        return bits;
    }
};

//=============================================================================
// StorageBitvec
//=============================================================================

/**
 * Growable bit vector stored as a length cell plus a vector of Bits256
 * chunks. The chunk count is always ceil(len / 256); bits at or past
 * `len` inside the last chunk are zero.
 */
class StorageBitvec {
public:
    static constexpr uint64_t FOOTPRINT =
        footprint_v<LazyCell<uint32_t>> + footprint_v<StorageVec<Bits256>>;

    StorageBitvec() : len_(0u) {}

    static StorageBitvec pull_spread(HostStorage& storage, KeyPtr& ptr);
    void push_spread(HostStorage& storage, KeyPtr& ptr);
    void clear_spread(HostStorage& storage, KeyPtr& ptr);

    uint32_t len() { return len_.get(); }
    bool is_empty() { return len() == 0; }

    /// Bits addressable without growing the chunk vector.
    uint32_t capacity() { return bits_.len() * Bits256::BITS; }

    std::optional<bool> get(uint32_t index);

    /// Throws IndexOutOfBounds if `index >= len()`.
    void set(uint32_t index, bool value);
    void reset(uint32_t index) { set(index, false); }

    void push(bool value);
    std::optional<bool> pop();

    uint32_t chunk_count() { return bits_.len(); }
    const Bits256* get_chunk(uint32_t chunk) { return bits_.get(chunk); }
    Bits256* get_chunk_mut(uint32_t chunk) { return bits_.get_mut(chunk); }

    /// Loads every chunk.
    uint64_t count_ones();

private:
    StorageBitvec(LazyCell<uint32_t> len, StorageVec<Bits256> bits)
        : len_(std::move(len)), bits_(std::move(bits)) {}

    LazyCell<uint32_t> len_;
    StorageVec<Bits256> bits_;
};

} // namespace cellar
