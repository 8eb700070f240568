/**
 * @file codec.hpp
 * @brief Deterministic binary codec for storage cells
 *
 * Encoding rules:
 * - integers: fixed width, little endian
 * - bool: one byte, 0x00 or 0x01
 * - std::string, std::vector<T>: compact length prefix then elements
 * - std::optional<T>: 0x00 for none, 0x01 followed by the value
 * - std::array<T, N>, std::pair<A, B>: plain concatenation
 * - Key: its 32 raw bytes
 *
 * User types plug in by specializing cellar::Codec<T> with
 * `static void encode(Encoder&, const T&)` and `static T decode(Decoder&)`.
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "key.hpp"

namespace cellar {

using Bytes = std::vector<uint8_t>;

//=============================================================================
// Encoder / Decoder
//=============================================================================

class Encoder {
public:
    Encoder() = default;

    void write(const uint8_t* data, size_t len) {
        buf_.insert(buf_.end(), data, data + len);
    }

    void write_byte(uint8_t byte) { buf_.push_back(byte); }

    /**
     * Variable-length length/count prefix.
     */
    void write_compact(uint64_t value);

    const Bytes& bytes() const { return buf_; }
    Bytes take() { return std::move(buf_); }
    size_t size() const { return buf_.size(); }

private:
    Bytes buf_;
};

class Decoder {
public:
    explicit Decoder(std::span<const uint8_t> data) : data_(data) {}

    /**
     * Copies `len` bytes into `out`; throws DecodeError on truncated input.
     */
    void read(uint8_t* out, size_t len);

    uint8_t read_byte();
    uint64_t read_compact();

    size_t remaining() const { return data_.size() - pos_; }
    bool at_end() const { return pos_ == data_.size(); }

private:
    std::span<const uint8_t> data_;
    size_t pos_ = 0;
};

//=============================================================================
// Codec customization point
//=============================================================================

template <typename T, typename = void>
struct Codec;

template <typename T>
void encode_to(Encoder& enc, const T& value) {
    Codec<T>::encode(enc, value);
}

template <typename T>
T decode_from(Decoder& dec) {
    return Codec<T>::decode(dec);
}

template <typename T>
Bytes encode(const T& value) {
    Encoder enc;
    encode_to(enc, value);
    return enc.take();
}

/**
 * Decodes exactly one T from `data`. Trailing bytes are an error.
 */
template <typename T>
T decode(std::span<const uint8_t> data) {
    Decoder dec(data);
    T value = decode_from<T>(dec);
    if (!dec.at_end()) {
        throw DecodeError("trailing bytes after decoding value (" +
                          std::to_string(dec.remaining()) + " left)");
    }
    return value;
}

// Integers (bool excluded)
template <typename T>
struct Codec<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static void encode(Encoder& enc, T value) {
        using U = std::make_unsigned_t<T>;
        U bits = static_cast<U>(value);
        uint8_t buf[sizeof(T)];
        for (size_t i = 0; i < sizeof(T); ++i) {
            buf[i] = static_cast<uint8_t>(bits & 0xFF);
            bits = static_cast<U>(bits >> 8);
        }
        enc.write(buf, sizeof(T));
    }

    static T decode(Decoder& dec) {
        using U = std::make_unsigned_t<T>;
        uint8_t buf[sizeof(T)];
        dec.read(buf, sizeof(T));
        U bits = 0;
        for (size_t i = sizeof(T); i > 0; --i) {
            bits = static_cast<U>((bits << 8) | buf[i - 1]);
        }
        return static_cast<T>(bits);
    }
};

template <>
struct Codec<bool> {
    static void encode(Encoder& enc, bool value) { enc.write_byte(value ? 1 : 0); }

    static bool decode(Decoder& dec) {
        uint8_t b = dec.read_byte();
        if (b > 1) {
            throw DecodeError("invalid bool byte " + std::to_string(b));
        }
        return b == 1;
    }
};

template <>
struct Codec<Key> {
    static void encode(Encoder& enc, const Key& key) { enc.write(key.data(), Key::SIZE); }

    static Key decode(Decoder& dec) {
        Key::Bytes bytes;
        dec.read(bytes.data(), bytes.size());
        return Key(bytes);
    }
};

template <>
struct Codec<std::string> {
    static void encode(Encoder& enc, const std::string& s) {
        enc.write_compact(s.size());
        enc.write(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    }

    static std::string decode(Decoder& dec) {
        uint64_t len = dec.read_compact();
        if (len > dec.remaining()) {
            throw DecodeError("string length " + std::to_string(len) + " exceeds input");
        }
        std::string s(static_cast<size_t>(len), '\0');
        dec.read(reinterpret_cast<uint8_t*>(s.data()), s.size());
        return s;
    }
};

template <typename T>
struct Codec<std::vector<T>> {
    static void encode(Encoder& enc, const std::vector<T>& v) {
        enc.write_compact(v.size());
        for (const auto& item : v) {
            encode_to(enc, item);
        }
    }

    static std::vector<T> decode(Decoder& dec) {
        uint64_t len = dec.read_compact();
        // every element occupies at least one byte
        if (len > dec.remaining()) {
            throw DecodeError("vector length " + std::to_string(len) + " exceeds input");
        }
        std::vector<T> v;
        v.reserve(static_cast<size_t>(len));
        for (uint64_t i = 0; i < len; ++i) {
            v.push_back(decode_from<T>(dec));
        }
        return v;
    }
};

template <typename T>
struct Codec<std::optional<T>> {
    static void encode(Encoder& enc, const std::optional<T>& opt) {
        if (opt) {
            enc.write_byte(1);
            encode_to(enc, *opt);
        } else {
            enc.write_byte(0);
        }
    }

    static std::optional<T> decode(Decoder& dec) {
        switch (dec.read_byte()) {
            case 0: return std::nullopt;
            case 1: return decode_from<T>(dec);
            default: throw DecodeError("invalid option tag");
        }
    }
};

template <typename T, size_t N>
struct Codec<std::array<T, N>> {
    static void encode(Encoder& enc, const std::array<T, N>& arr) {
        for (const auto& item : arr) {
            encode_to(enc, item);
        }
    }

    static std::array<T, N> decode(Decoder& dec) {
        std::array<T, N> arr{};
        for (auto& item : arr) {
            item = decode_from<T>(dec);
        }
        return arr;
    }
};

template <typename A, typename B>
struct Codec<std::pair<A, B>> {
    static void encode(Encoder& enc, const std::pair<A, B>& p) {
        encode_to(enc, p.first);
        encode_to(enc, p.second);
    }

    static std::pair<A, B> decode(Decoder& dec) {
        A a = decode_from<A>(dec);
        B b = decode_from<B>(dec);
        return {std::move(a), std::move(b)};
    }
};

} // namespace cellar
