/**
 * @file entry.hpp
 * @brief Cached storage value with a dirty flag
 */

#pragma once

#include <optional>
#include <utility>

#include "host_storage.hpp"
#include "key.hpp"
#include "storage_traits.hpp"

namespace cellar {

enum class EntryState {
    Mutated,    // differs from storage, flushed on next push
    Preserved,  // in sync with storage
};

/**
 * An optional value owned by a lazy container's cache.
 *
 * Containers keep entries in node-based maps, so a reference obtained from
 * value()/value_mut() stays valid while other entries are inserted.
 */
template <typename T>
class Entry {
public:
    Entry(std::optional<T> value, EntryState state) : value_(std::move(value)), state_(state) {}

    const std::optional<T>& value() const { return value_; }

    /**
     * Mutable view of the value. Marks the entry dirty if a value is
     * present, since the caller may change it through the reference.
     */
    std::optional<T>& value_mut() {
        if (value_) {
            state_ = EntryState::Mutated;
        }
        return value_;
    }

    /**
     * Replaces the value and returns the old one. None over None is a
     * no-op and leaves the state untouched.
     */
    std::optional<T> put(std::optional<T> new_value) {
        if (value_ || new_value) {
            state_ = EntryState::Mutated;
        }
        std::swap(value_, new_value);
        return new_value;
    }

    std::optional<T> take_value() {
        if (!value_) {
            return std::nullopt;
        }
        state_ = EntryState::Mutated;
        std::optional<T> old = std::move(value_);
        value_.reset();
        return old;
    }

    EntryState state() const { return state_; }
    bool is_mutated() const { return state_ == EntryState::Mutated; }
    void set_state(EntryState state) { state_ = state; }

    static Entry pull_packed_root(HostStorage& storage, const Key& key) {
        return Entry(pull_packed_root_opt<T>(storage, key), EntryState::Preserved);
    }

    /**
     * Writes or clears the cell at `key` if dirty. Returns whether host I/O
     * was issued.
     */
    bool push_packed_root(HostStorage& storage, const Key& key) {
        if (!is_mutated()) {
            return false;
        }
        if (value_) {
            cellar::push_packed_root(*value_, storage, key);
        } else {
            clear_packed_root(storage, key);
        }
        state_ = EntryState::Preserved;
        return true;
    }

    static Entry pull_spread_root(HostStorage& storage, const Key& root) {
        return Entry(pull_spread_root_opt<T>(storage, root), EntryState::Preserved);
    }

    /**
     * Spread counterpart of push_packed_root. An emptied spread value
     * clears only its root cell.
     */
    bool push_spread_root(HostStorage& storage, const Key& root) {
        if (!is_mutated()) {
            return false;
        }
        if (value_) {
            cellar::push_spread_root(*value_, storage, root);
        } else {
            clear_packed_root(storage, root);
        }
        state_ = EntryState::Preserved;
        return true;
    }

private:
    std::optional<T> value_;
    EntryState state_;
};

} // namespace cellar
