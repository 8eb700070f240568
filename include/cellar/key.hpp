/**
 * @file key.hpp
 * @brief Storage keys, key differences and the key pointer cursor
 *
 * A Key is a 32-byte big-endian address into contract storage. It supports
 * wrapping integer arithmetic so that containers can derive element keys
 * from a base key. KeyPtr hands out disjoint key regions to the fields of
 * a storage layout according to their footprints.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace cellar {

using u128 = unsigned __int128;

class KeyDiff;

/// Integer types accepted as key offsets besides uint32_t, uint64_t and u128.
template <typename N>
inline constexpr bool is_key_offset_v =
    std::is_integral_v<N> && !std::is_same_v<N, bool> && sizeof(N) <= sizeof(uint64_t);

//=============================================================================
// Key
//=============================================================================

/**
 * Typeless address into contract storage.
 *
 * Arithmetic wraps at the 2^256 boundary and never throws.
 */
class Key {
public:
    static constexpr size_t SIZE = 32;
    using Bytes = std::array<uint8_t, SIZE>;

    Key() : bytes_{} {}
    explicit Key(const Bytes& bytes) : bytes_(bytes) {}

    /**
     * Key with every byte set to `byte`.
     */
    static Key filled(uint8_t byte);

    const Bytes& bytes() const { return bytes_; }
    Bytes& bytes_mut() { return bytes_; }
    const uint8_t* data() const { return bytes_.data(); }

    Key& operator+=(uint32_t rhs);
    Key& operator+=(uint64_t rhs);
    Key& operator+=(u128 rhs);
    Key& operator-=(uint32_t rhs);
    Key& operator-=(uint64_t rhs);
    Key& operator-=(u128 rhs);

    /**
     * Any other integer offset, e.g. a plain int literal. Negative values
     * step backwards.
     */
    template <typename N, typename = std::enable_if_t<is_key_offset_v<N>>>
    Key& operator+=(N rhs) {
        if constexpr (std::is_signed_v<N>) {
            if (rhs < 0) {
                return *this -= magnitude(rhs);
            }
        }
        return *this += static_cast<uint64_t>(rhs);
    }

    template <typename N, typename = std::enable_if_t<is_key_offset_v<N>>>
    Key& operator-=(N rhs) {
        if constexpr (std::is_signed_v<N>) {
            if (rhs < 0) {
                return *this += magnitude(rhs);
            }
        }
        return *this -= static_cast<uint64_t>(rhs);
    }

    /**
     * Full hex form: 0x followed by 4-byte groups separated by '_'.
     */
    std::string to_string() const;

    /**
     * Abbreviated form showing the first and last four bytes.
     */
    std::string to_short_string() const;

    friend bool operator==(const Key& a, const Key& b) { return a.bytes_ == b.bytes_; }
    friend bool operator!=(const Key& a, const Key& b) { return a.bytes_ != b.bytes_; }
    friend bool operator<(const Key& a, const Key& b) { return a.bytes_ < b.bytes_; }
    friend bool operator<=(const Key& a, const Key& b) { return a.bytes_ <= b.bytes_; }
    friend bool operator>(const Key& a, const Key& b) { return a.bytes_ > b.bytes_; }
    friend bool operator>=(const Key& a, const Key& b) { return a.bytes_ >= b.bytes_; }

    template <typename H>
    friend H AbslHashValue(H h, const Key& key) {
        return H::combine(std::move(h), key.bytes_);
    }

private:
    template <typename N>
    static uint64_t magnitude(N negative) {
        return uint64_t{0} - static_cast<uint64_t>(negative);
    }

    Bytes bytes_;
};

inline Key operator+(Key lhs, uint32_t rhs) { return lhs += rhs; }
inline Key operator+(Key lhs, uint64_t rhs) { return lhs += rhs; }
inline Key operator+(Key lhs, u128 rhs) { return lhs += rhs; }
inline Key operator-(Key lhs, uint32_t rhs) { return lhs -= rhs; }
inline Key operator-(Key lhs, uint64_t rhs) { return lhs -= rhs; }
inline Key operator-(Key lhs, u128 rhs) { return lhs -= rhs; }

template <typename N, typename = std::enable_if_t<is_key_offset_v<N>>>
inline Key operator+(Key lhs, N rhs) { return lhs += rhs; }

template <typename N, typename = std::enable_if_t<is_key_offset_v<N>>>
inline Key operator-(Key lhs, N rhs) { return lhs -= rhs; }

/**
 * Difference of two keys, computed as lhs + (-rhs) modulo 2^256.
 */
KeyDiff operator-(const Key& lhs, const Key& rhs);

std::ostream& operator<<(std::ostream& os, const Key& key);

//=============================================================================
// KeyDiff
//=============================================================================

/**
 * Result of subtracting one key from another.
 *
 * Converts to a primitive only if every byte above the primitive's width
 * is zero.
 */
class KeyDiff {
public:
    explicit KeyDiff(const Key::Bytes& bytes) : bytes_(bytes) {}

    std::optional<uint32_t> try_to_u32() const;
    std::optional<uint64_t> try_to_u64() const;
    std::optional<u128> try_to_u128() const;

    const Key::Bytes& bytes() const { return bytes_; }

    friend bool operator==(const KeyDiff& a, const KeyDiff& b) { return a.bytes_ == b.bytes_; }
    friend bool operator!=(const KeyDiff& a, const KeyDiff& b) { return a.bytes_ != b.bytes_; }

private:
    template <typename N>
    std::optional<N> try_to() const;

    Key::Bytes bytes_;
};

//=============================================================================
// Footprint
//=============================================================================

/**
 * Number of storage cells a type occupies.
 *
 * Packed types (anything with a codec) take one cell. Spread-layout types
 * declare `static constexpr uint64_t FOOTPRINT`.
 */
template <typename T, typename = void>
struct Footprint {
    static constexpr uint64_t value = 1;
};

template <typename T>
struct Footprint<T, std::void_t<decltype(T::FOOTPRINT)>> {
    static constexpr uint64_t value = T::FOOTPRINT;
};

template <typename T>
inline constexpr uint64_t footprint_v = Footprint<T>::value;

//=============================================================================
// KeyPtr
//=============================================================================

/**
 * Cursor over keys.
 *
 * Every pull or push of a layout walks its fields in the same order, so
 * both directions compute the same key for each field.
 */
class KeyPtr {
public:
    explicit KeyPtr(const Key& key) : key_(key) {}

    /**
     * Returns the current key and advances by the footprint of T.
     */
    template <typename T>
    Key next_for() {
        return advance_by(footprint_v<T>);
    }

    /**
     * Returns the current key and advances by `footprint` cells.
     */
    Key advance_by(uint64_t footprint) {
        Key current = key_;
        key_ += footprint;
        return current;
    }

    const Key& key() const { return key_; }

    /**
     * Attaches bytes already read from the cell at the current key. The
     * first field pulled from that key takes them instead of reading the
     * cell again.
     */
    void preload(std::vector<uint8_t> bytes) { preloaded_.emplace(key_, std::move(bytes)); }

    /// Preloaded bytes for `key`, if any. Consumed by the call.
    std::optional<std::vector<uint8_t>> take_preloaded(const Key& key) {
        if (!preloaded_ || preloaded_->first != key) {
            return std::nullopt;
        }
        std::optional<std::vector<uint8_t>> bytes = std::move(preloaded_->second);
        preloaded_.reset();
        return bytes;
    }

private:
    Key key_;
    std::optional<std::pair<Key, std::vector<uint8_t>>> preloaded_;
};

} // namespace cellar
