/**
 * @file lazy_cell.hpp
 * @brief Single packed value loaded on first access
 */

#pragma once

#include <optional>
#include <utility>

#include "entry.hpp"
#include "errors.hpp"
#include "storage_traits.hpp"

namespace cellar {

/**
 * Holds one packed value, typically a collection header. The value must
 * exist once accessed: reading an empty cell throws DecodeError.
 */
template <typename T>
class LazyCell {
    static_assert(!is_spread_v<T>, "LazyCell stores packed values only");

public:
    static constexpr uint64_t FOOTPRINT = 1;

    LazyCell() = default;
    explicit LazyCell(T value) : entry_(Entry<T>(std::move(value), EntryState::Mutated)) {}

    LazyCell(LazyCell&&) = default;
    LazyCell& operator=(LazyCell&&) = default;
    LazyCell(const LazyCell&) = delete;
    LazyCell& operator=(const LazyCell&) = delete;

    static LazyCell pull_spread(HostStorage& storage, KeyPtr& ptr) {
        Key key = ptr.next_for<LazyCell>();
        LazyCell cell;
        cell.binding_.bind(storage, key, "LazyCell");
        if (auto bytes = ptr.take_preloaded(key)) {
            cell.entry_.emplace(decode_cell<T>(*bytes, key), EntryState::Preserved);
        }
        return cell;
    }

    void push_spread(HostStorage& storage, KeyPtr& ptr) {
        Key key = ptr.next_for<LazyCell>();
        binding_.bind(storage, key, "LazyCell");
        if (entry_) {
            entry_->push_packed_root(storage, key);
        }
    }

    void clear_spread(HostStorage& storage, KeyPtr& ptr) {
        Key key = ptr.next_for<LazyCell>();
        binding_.bind(storage, key, "LazyCell");
        clear_packed_root(storage, key);
        entry_.emplace(std::nullopt, EntryState::Preserved);
    }

    const std::optional<Key>& key() const { return binding_.key(); }

    bool is_cached() const { return entry_.has_value(); }

    const T& get() { return *load().value(); }

    /// Marks the cell dirty.
    T& get_mut() { return *load().value_mut(); }

    void set(T value) {
        if (entry_) {
            entry_->put(std::move(value));
        } else {
            entry_.emplace(std::move(value), EntryState::Mutated);
        }
    }

private:
    Entry<T>& load() {
        if (!entry_) {
            const Key& key = binding_.root("LazyCell");
            entry_.emplace(Entry<T>::pull_packed_root(binding_.host("LazyCell"), key));
        }
        if (!entry_->value()) {
            throw DecodeError("LazyCell: storage entry not found at " +
                              (binding_.key() ? binding_.key()->to_string() : std::string("<unbound>")));
        }
        return *entry_;
    }

    StorageBinding binding_;
    std::optional<Entry<T>> entry_;
};

} // namespace cellar
