/**
 * @file key.cpp
 * @brief Wrapping big-endian arithmetic over 32-byte storage keys
 */

#include "key.hpp"

#include <cstdio>
#include <sstream>

namespace cellar {

namespace {

/**
 * Adds big-endian `rhs` (right aligned) onto `lhs`, wrapping on overflow.
 */
void bytes_add_bytes(Key::Bytes& lhs, const uint8_t* rhs, size_t rhs_len) {
    unsigned carry = 0;
    for (size_t i = 0; i < Key::SIZE; ++i) {
        size_t pos = Key::SIZE - 1 - i;
        unsigned addend = i < rhs_len ? rhs[rhs_len - 1 - i] : 0;
        if (i >= rhs_len && carry == 0) {
            break;
        }
        unsigned sum = static_cast<unsigned>(lhs[pos]) + addend + carry;
        lhs[pos] = static_cast<uint8_t>(sum & 0xFF);
        carry = sum >> 8;
    }
}

/**
 * Subtracts big-endian `rhs` (right aligned) from `lhs`, wrapping on underflow.
 */
void bytes_sub_bytes(Key::Bytes& lhs, const uint8_t* rhs, size_t rhs_len) {
    int borrow = 0;
    for (size_t i = 0; i < Key::SIZE; ++i) {
        size_t pos = Key::SIZE - 1 - i;
        int subtrahend = i < rhs_len ? rhs[rhs_len - 1 - i] : 0;
        if (i >= rhs_len && borrow == 0) {
            break;
        }
        int diff = static_cast<int>(lhs[pos]) - subtrahend - borrow;
        borrow = diff < 0 ? 1 : 0;
        lhs[pos] = static_cast<uint8_t>(diff + (borrow << 8));
    }
}

/**
 * Two's complement negation.
 */
void negate_bytes(Key::Bytes& bytes) {
    for (auto& b : bytes) {
        b = static_cast<uint8_t>(~b);
    }
    const uint8_t one = 1;
    bytes_add_bytes(bytes, &one, 1);
}

template <typename N>
std::array<uint8_t, sizeof(N)> to_be_bytes(N value) {
    std::array<uint8_t, sizeof(N)> out{};
    for (size_t i = 0; i < sizeof(N); ++i) {
        out[sizeof(N) - 1 - i] = static_cast<uint8_t>(value & 0xFF);
        value >>= 8;
    }
    return out;
}

} // namespace

//=============================================================================
// Key
//=============================================================================

Key Key::filled(uint8_t byte) {
    Bytes bytes;
    bytes.fill(byte);
    return Key(bytes);
}

Key& Key::operator+=(uint32_t rhs) {
    auto be = to_be_bytes(rhs);
    bytes_add_bytes(bytes_, be.data(), be.size());
    return *this;
}

Key& Key::operator+=(uint64_t rhs) {
    auto be = to_be_bytes(rhs);
    bytes_add_bytes(bytes_, be.data(), be.size());
    return *this;
}

Key& Key::operator+=(u128 rhs) {
    auto be = to_be_bytes(rhs);
    bytes_add_bytes(bytes_, be.data(), be.size());
    return *this;
}

Key& Key::operator-=(uint32_t rhs) {
    auto be = to_be_bytes(rhs);
    bytes_sub_bytes(bytes_, be.data(), be.size());
    return *this;
}

Key& Key::operator-=(uint64_t rhs) {
    auto be = to_be_bytes(rhs);
    bytes_sub_bytes(bytes_, be.data(), be.size());
    return *this;
}

Key& Key::operator-=(u128 rhs) {
    auto be = to_be_bytes(rhs);
    bytes_sub_bytes(bytes_, be.data(), be.size());
    return *this;
}

std::string Key::to_string() const {
    std::string out = "0x";
    char buf[3];
    for (size_t n = 0; n < SIZE; ++n) {
        std::snprintf(buf, sizeof(buf), "%02X", bytes_[n]);
        out += buf;
        if (n % 4 == 3 && n != SIZE - 1) {
            out += '_';
        }
    }
    return out;
}

std::string Key::to_short_string() const {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "0x%02X%02X_%02X%02X_..._%02X%02X_%02X%02X",
                  bytes_[0], bytes_[1], bytes_[2], bytes_[3],
                  bytes_[28], bytes_[29], bytes_[30], bytes_[31]);
    return buf;
}

KeyDiff operator-(const Key& lhs, const Key& rhs) {
    Key::Bytes result = lhs.bytes();
    Key::Bytes negated = rhs.bytes();
    negate_bytes(negated);
    bytes_add_bytes(result, negated.data(), negated.size());
    return KeyDiff(result);
}

std::ostream& operator<<(std::ostream& os, const Key& key) {
    return os << "Key(" << key.to_string() << ")";
}

//=============================================================================
// KeyDiff
//=============================================================================

template <typename N>
std::optional<N> KeyDiff::try_to() const {
    constexpr size_t prim_bytes = sizeof(N);
    for (size_t i = 0; i < Key::SIZE - prim_bytes; ++i) {
        if (bytes_[i] != 0) {
            return std::nullopt;
        }
    }
    N value = 0;
    for (size_t i = Key::SIZE - prim_bytes; i < Key::SIZE; ++i) {
        value = static_cast<N>((value << 8) | bytes_[i]);
    }
    return value;
}

std::optional<uint32_t> KeyDiff::try_to_u32() const { return try_to<uint32_t>(); }
std::optional<uint64_t> KeyDiff::try_to_u64() const { return try_to<uint64_t>(); }
std::optional<u128> KeyDiff::try_to_u128() const { return try_to<u128>(); }

} // namespace cellar
