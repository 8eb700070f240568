/**
 * @file codec.cpp
 * @brief Compact length prefixes and bounds-checked reads
 */

#include "codec.hpp"

namespace cellar {

namespace {

constexpr uint64_t SINGLE_BYTE_LIMIT = 1ULL << 6;
constexpr uint64_t TWO_BYTE_LIMIT = 1ULL << 14;
constexpr uint64_t FOUR_BYTE_LIMIT = 1ULL << 30;

} // namespace

//=============================================================================
// Encoder
//=============================================================================

void Encoder::write_compact(uint64_t value) {
    if (value < SINGLE_BYTE_LIMIT) {
        write_byte(static_cast<uint8_t>(value << 2));
    } else if (value < TWO_BYTE_LIMIT) {
        uint16_t v = static_cast<uint16_t>((value << 2) | 0b01);
        encode_to(*this, v);
    } else if (value < FOUR_BYTE_LIMIT) {
        uint32_t v = static_cast<uint32_t>((value << 2) | 0b10);
        encode_to(*this, v);
    } else {
        // big-integer mode: prefix carries the byte count minus four
        uint8_t len = 8;
        while (len > 4 && ((value >> ((len - 1) * 8)) & 0xFF) == 0) {
            --len;
        }
        write_byte(static_cast<uint8_t>(((len - 4) << 2) | 0b11));
        for (uint8_t i = 0; i < len; ++i) {
            write_byte(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
        }
    }
}

//=============================================================================
// Decoder
//=============================================================================

void Decoder::read(uint8_t* out, size_t len) {
    if (len > remaining()) {
        throw DecodeError("unexpected end of input: need " + std::to_string(len) +
                          " bytes, have " + std::to_string(remaining()));
    }
    if (len > 0) {
        std::memcpy(out, data_.data() + pos_, len);
    }
    pos_ += len;
}

uint8_t Decoder::read_byte() {
    uint8_t b;
    read(&b, 1);
    return b;
}

uint64_t Decoder::read_compact() {
    uint8_t first = read_byte();
    switch (first & 0b11) {
        case 0b00:
            return first >> 2;
        case 0b01: {
            uint8_t second = read_byte();
            uint64_t value = ((static_cast<uint64_t>(second) << 8) | first) >> 2;
            if (value < SINGLE_BYTE_LIMIT) {
                throw DecodeError("non-canonical compact encoding");
            }
            return value;
        }
        case 0b10: {
            uint8_t rest[3];
            read(rest, 3);
            uint64_t raw = first | (static_cast<uint64_t>(rest[0]) << 8) |
                           (static_cast<uint64_t>(rest[1]) << 16) |
                           (static_cast<uint64_t>(rest[2]) << 24);
            uint64_t value = raw >> 2;
            if (value < TWO_BYTE_LIMIT) {
                throw DecodeError("non-canonical compact encoding");
            }
            return value;
        }
        default: {
            size_t len = static_cast<size_t>(first >> 2) + 4;
            if (len > 8) {
                throw DecodeError("compact integer wider than 64 bits");
            }
            uint64_t value = 0;
            for (size_t i = 0; i < len; ++i) {
                value |= static_cast<uint64_t>(read_byte()) << (i * 8);
            }
            if (value < FOUR_BYTE_LIMIT || (len > 4 && (value >> ((len - 1) * 8)) == 0)) {
                throw DecodeError("non-canonical compact encoding");
            }
            return value;
        }
    }
}

} // namespace cellar
