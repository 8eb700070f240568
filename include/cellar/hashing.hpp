/**
 * @file hashing.hpp
 * @brief 256-bit hashers used to derive storage keys
 */

#pragma once

#include <span>

#include "codec.hpp"
#include "key.hpp"

namespace cellar {

struct Sha2x256 {
    static constexpr const char* NAME = "sha2-256";
    static Key::Bytes hash(std::span<const uint8_t> input);
};

struct Sha3x256 {
    static constexpr const char* NAME = "sha3-256";
    static Key::Bytes hash(std::span<const uint8_t> input);
};

/**
 * Accumulates codec-encoded values and hashes them into a Key.
 */
template <typename H>
class HashBuilder {
public:
    template <typename T>
    HashBuilder& update(const T& value) {
        encode_to(enc_, value);
        return *this;
    }

    Key finish() const { return Key(H::hash(enc_.bytes())); }

    template <typename T>
    static Key hash_value(const T& value) {
        return HashBuilder().update(value).finish();
    }

private:
    Encoder enc_;
};

} // namespace cellar
