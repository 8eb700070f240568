/**
 * @file stash.hpp
 * @brief Slot table with index reuse through an in-place free list
 */

#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "codec.hpp"
#include "errors.hpp"
#include "lazy_cell.hpp"
#include "lazy_index_map.hpp"

namespace cellar {

struct StashHeader {
    uint32_t next_vacant = 0;   // head of the free list; == max_len when empty
    uint32_t len = 0;           // occupied slots
    uint32_t max_len = 0;       // slots ever used, never shrinks except on clear
};

template <>
struct Codec<StashHeader> {
    static void encode(Encoder& enc, const StashHeader& h) {
        encode_to(enc, h.next_vacant);
        encode_to(enc, h.len);
        encode_to(enc, h.max_len);
    }

    static StashHeader decode(Decoder& dec) {
        StashHeader h;
        h.next_vacant = decode_from<uint32_t>(dec);
        h.len = decode_from<uint32_t>(dec);
        h.max_len = decode_from<uint32_t>(dec);
        return h;
    }
};

struct StashVacant {
    uint32_t next;
};

/**
 * A stash slot: either a link in the free list or an occupied value.
 */
template <typename T>
class StashEntry {
public:
    static StashEntry vacant(uint32_t next) { return StashEntry(StashVacant{next}); }
    static StashEntry occupied(T value) { return StashEntry(std::in_place, std::move(value)); }

    bool is_occupied() const { return slot_.index() == 1; }
    bool is_vacant() const { return slot_.index() == 0; }

    const T* value() const { return std::get_if<1>(&slot_); }
    T* value() { return std::get_if<1>(&slot_); }

    std::optional<uint32_t> next_vacant() const {
        if (const auto* v = std::get_if<0>(&slot_)) {
            return v->next;
        }
        return std::nullopt;
    }

private:
    explicit StashEntry(StashVacant vacant) : slot_(std::in_place_index<0>, vacant) {}
    StashEntry(std::in_place_t, T value) : slot_(std::in_place_index<1>, std::move(value)) {}

    std::variant<StashVacant, T> slot_;
};

template <typename T>
struct Codec<StashEntry<T>> {
    static void encode(Encoder& enc, const StashEntry<T>& entry) {
        if (const T* value = entry.value()) {
            enc.write_byte(1);
            encode_to(enc, *value);
        } else {
            enc.write_byte(0);
            encode_to(enc, *entry.next_vacant());
        }
    }

    static StashEntry<T> decode(Decoder& dec) {
        switch (dec.read_byte()) {
            case 0: return StashEntry<T>::vacant(decode_from<uint32_t>(dec));
            case 1: return StashEntry<T>::occupied(decode_from<T>(dec));
            default: throw DecodeError("invalid stash entry tag");
        }
    }
};

/**
 * Values are stored at stable u32 indices. take() links the freed slot at
 * the head of the free list and put() reuses the most recently freed slot
 * first, so index assignment depends only on the sequence of calls.
 */
template <typename T>
class Stash {
public:
    static constexpr uint64_t FOOTPRINT =
        footprint_v<LazyCell<StashHeader>> + footprint_v<LazyIndexMap<StashEntry<T>>>;

    Stash() : header_(StashHeader{}) {}

    static Stash pull_spread(HostStorage& storage, KeyPtr& ptr) {
        auto header = LazyCell<StashHeader>::pull_spread(storage, ptr);
        auto entries = LazyIndexMap<StashEntry<T>>::pull_spread(storage, ptr);
        return Stash(std::move(header), std::move(entries));
    }

    void push_spread(HostStorage& storage, KeyPtr& ptr) {
        header_.push_spread(storage, ptr);
        entries_.push_spread(storage, ptr);
    }

    void clear_spread(HostStorage& storage, KeyPtr& ptr) {
        clear();
        header_.clear_spread(storage, ptr);
        entries_.push_spread(storage, ptr);
    }

    uint32_t len() { return header_.get().len; }
    uint32_t max_len() { return header_.get().max_len; }
    bool is_empty() { return len() == 0; }

    const std::optional<Key>& entries_key() const { return entries_.key(); }

    const T* get(uint32_t at) {
        if (at >= max_len()) {
            return nullptr;
        }
        const StashEntry<T>* entry = entries_.get(at);
        return entry ? entry->value() : nullptr;
    }

    T* get_mut(uint32_t at) {
        if (!get(at)) {
            return nullptr;
        }
        return entries_.get_mut(at)->value();
    }

    /**
     * Stores `value` and returns its index.
     */
    uint32_t put(T value) {
        StashHeader& header = header_.get_mut();
        uint32_t at = header.next_vacant;
        if (at == header.max_len) {
            if (header.max_len == std::numeric_limits<uint32_t>::max()) {
                throw CapacityExceeded("Stash: cannot store more than u32::MAX entries");
            }
            entries_.put(at, StashEntry<T>::occupied(std::move(value)));
            header.max_len += 1;
            header.next_vacant = header.max_len;
        } else {
            auto old = entries_.put_get(at, StashEntry<T>::occupied(std::move(value)));
            if (!old || !old->is_vacant()) {
                throw InvariantViolation("Stash: free list head " + std::to_string(at) +
                                         " does not point to a vacant entry");
            }
            header.next_vacant = *old->next_vacant();
        }
        header.len += 1;
        return at;
    }

    /**
     * Removes the value at `at`. Vacant and out-of-range slots yield
     * nullopt; the latter without touching storage.
     */
    std::optional<T> take(uint32_t at) {
        if (!get(at)) {
            return std::nullopt;
        }
        StashHeader& header = header_.get_mut();
        auto old = entries_.put_get(at, StashEntry<T>::vacant(header.next_vacant));
        header.next_vacant = at;
        header.len -= 1;
        return std::move(*old->value());
    }

    /**
     * Like take() but never loads the slot. The caller guarantees that
     * `at` is occupied; out-of-range slots, an empty stash and the current
     * free-list head throw InvariantViolation.
     */
    void remove_occupied(uint32_t at) {
        StashHeader& header = header_.get_mut();
        if (at >= header.max_len) {
            throw InvariantViolation("Stash: remove_occupied(" + std::to_string(at) +
                                     ") beyond max_len " + std::to_string(header.max_len));
        }
        if (header.len == 0 || at == header.next_vacant) {
            throw InvariantViolation("Stash: remove_occupied(" + std::to_string(at) +
                                     ") on a vacant slot");
        }
        entries_.put(at, StashEntry<T>::vacant(header.next_vacant));
        header.next_vacant = at;
        header.len -= 1;
    }

    /**
     * Drops every slot. Their cells are cleared on the next push.
     */
    void clear() {
        uint32_t n = max_len();
        for (uint32_t i = 0; i < n; ++i) {
            entries_.put(i, std::nullopt);
        }
        header_.set(StashHeader{});
    }

    /**
     * Visits occupied slots in index order.
     */
    template <typename F>
    void for_each(F&& fn) {
        uint32_t remaining = len();
        uint32_t n = max_len();
        for (uint32_t i = 0; i < n && remaining > 0; ++i) {
            if (const T* value = get(i)) {
                fn(i, *value);
                --remaining;
            }
        }
    }

    std::vector<uint32_t> indices() {
        std::vector<uint32_t> out;
        for_each([&out](uint32_t i, const T&) { out.push_back(i); });
        return out;
    }

private:
    Stash(LazyCell<StashHeader> header, LazyIndexMap<StashEntry<T>> entries)
        : header_(std::move(header)), entries_(std::move(entries)) {}

    LazyCell<StashHeader> header_;
    LazyIndexMap<StashEntry<T>> entries_;
};

} // namespace cellar
