/**
 * @file storage_traits.hpp
 * @brief Packed and spread storage layouts
 *
 * A packed value is encoded into exactly one cell. A spread value is a
 * composite that distributes its fields over consecutive keys handed out
 * by a KeyPtr. Spread types provide:
 *
 *   static constexpr uint64_t FOOTPRINT;
 *   static T pull_spread(HostStorage&, KeyPtr&);
 *   void push_spread(HostStorage&, KeyPtr&);
 *   void clear_spread(HostStorage&, KeyPtr&);
 *
 * Every other type is packed and must have a Codec.
 */

#pragma once

#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <utility>

#include "codec.hpp"
#include "errors.hpp"
#include "host_storage.hpp"
#include "key.hpp"
#include "logging.hpp"

namespace cellar {

template <typename T, typename = void>
struct IsSpreadLayout : std::false_type {};

template <typename T>
struct IsSpreadLayout<T, std::void_t<decltype(T::pull_spread(std::declval<HostStorage&>(),
                                                             std::declval<KeyPtr&>()))>>
    : std::true_type {};

template <typename T>
inline constexpr bool is_spread_v = IsSpreadLayout<T>::value;

//=============================================================================
// Packed roots
//=============================================================================

/**
 * Decodes bytes read from the cell at `key`.
 */
template <typename T>
T decode_cell(std::span<const uint8_t> bytes, const Key& key) {
    try {
        return decode<T>(bytes);
    } catch (const DecodeError& e) {
        CELLAR_LOG_ERROR("layout", "corrupted cell at ", key.to_string(), ": ", e.what());
        throw;
    }
}

/**
 * Loads and decodes the cell at `key`; nullopt if the cell is empty.
 */
template <typename T>
std::optional<T> pull_packed_root_opt(HostStorage& storage, const Key& key) {
    auto bytes = storage.load(key);
    if (!bytes) {
        return std::nullopt;
    }
    return decode_cell<T>(*bytes, key);
}

template <typename T>
T pull_packed_root(HostStorage& storage, const Key& key) {
    auto value = pull_packed_root_opt<T>(storage, key);
    if (!value) {
        throw DecodeError("storage entry not found at " + key.to_string());
    }
    return std::move(*value);
}

template <typename T>
void push_packed_root(const T& value, HostStorage& storage, const Key& key) {
    Bytes bytes = encode(value);
    storage.store(key, bytes);
}

inline void clear_packed_root(HostStorage& storage, const Key& key) {
    storage.clear(key);
}

//=============================================================================
// SpreadLayout dispatch
//=============================================================================

template <typename T, typename = void>
struct SpreadLayout {
    static T pull(HostStorage& storage, KeyPtr& ptr) {
        return pull_packed_root<T>(storage, ptr.next_for<T>());
    }

    static void push(const T& value, HostStorage& storage, KeyPtr& ptr) {
        push_packed_root(value, storage, ptr.next_for<T>());
    }

    static void clear(const T&, HostStorage& storage, KeyPtr& ptr) {
        clear_packed_root(storage, ptr.next_for<T>());
    }
};

template <typename T>
struct SpreadLayout<T, std::enable_if_t<is_spread_v<T>>> {
    static T pull(HostStorage& storage, KeyPtr& ptr) { return T::pull_spread(storage, ptr); }

    static void push(T& value, HostStorage& storage, KeyPtr& ptr) {
        value.push_spread(storage, ptr);
    }

    static void clear(T& value, HostStorage& storage, KeyPtr& ptr) {
        value.clear_spread(storage, ptr);
    }
};

//=============================================================================
// Spread roots
//=============================================================================

template <typename T>
T pull_spread_root(HostStorage& storage, const Key& root) {
    KeyPtr ptr(root);
    return SpreadLayout<T>::pull(storage, ptr);
}

template <typename T>
void push_spread_root(T& value, HostStorage& storage, const Key& root) {
    KeyPtr ptr(root);
    SpreadLayout<T>::push(value, storage, ptr);
}

template <typename T>
void clear_spread_root(T& value, HostStorage& storage, const Key& root) {
    KeyPtr ptr(root);
    SpreadLayout<T>::clear(value, storage, ptr);
}

/**
 * Pulls an optional value rooted at `root`.
 *
 * A packed value is absent when its cell is empty. A spread value is
 * absent when the cell at its root key is empty; every spread type in
 * this library stores a header there. The root cell is read once: its
 * bytes are handed on to the header through the KeyPtr.
 */
template <typename T>
std::optional<T> pull_spread_root_opt(HostStorage& storage, const Key& root) {
    if constexpr (is_spread_v<T>) {
        auto bytes = storage.load(root);
        if (!bytes) {
            return std::nullopt;
        }
        KeyPtr ptr(root);
        ptr.preload(std::move(*bytes));
        return SpreadLayout<T>::pull(storage, ptr);
    } else {
        return pull_packed_root_opt<T>(storage, root);
    }
}

//=============================================================================
// StorageBinding
//=============================================================================

/**
 * Root key and host a storage-backed container is attached to.
 *
 * A container is bound when pulled from storage, or on its first push.
 * Afterwards it may only be pushed back to the same key.
 */
class StorageBinding {
public:
    void bind(HostStorage& host, const Key& key, const char* owner) {
        if (key_ && *key_ != key) {
            CELLAR_LOG_ERROR("layout", owner, " bound to ", key_->to_string(),
                             " was pushed to ", key.to_string());
            throw LayoutMismatch(std::string(owner) + " pulled from " + key_->to_string() +
                                 " but pushed to " + key.to_string());
        }
        key_ = key;
        host_ = &host;
    }

    bool is_bound() const { return key_.has_value(); }
    const std::optional<Key>& key() const { return key_; }

    /**
     * Root key; throws UninitializedAccess if the container is unbound.
     */
    const Key& root(const char* owner) const {
        if (!key_) {
            throw UninitializedAccess(std::string(owner) + ": cannot load lazily in this state");
        }
        return *key_;
    }

    HostStorage& host(const char* owner) const {
        if (!host_) {
            throw UninitializedAccess(std::string(owner) + ": cannot load lazily in this state");
        }
        return *host_;
    }

private:
    std::optional<Key> key_;
    HostStorage* host_ = nullptr;
};

} // namespace cellar
