/**
 * @file host_storage.hpp
 * @brief Byte-addressed key/value store provided by the host
 */

#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "codec.hpp"
#include "key.hpp"

namespace cellar {

/**
 * Contract storage as seen by this library.
 *
 * All three operations are infallible from the caller's point of view;
 * a failing host signals by throwing.
 */
class HostStorage {
public:
    virtual ~HostStorage() = default;

    /// Unconditionally overwrites the cell at `key`.
    virtual void store(const Key& key, std::span<const uint8_t> value) = 0;

    /// Raw bytes at `key`, or nullopt if never written or cleared.
    virtual std::optional<Bytes> load(const Key& key) = 0;

    /// Removes the cell; a following load returns nullopt.
    virtual void clear(const Key& key) = 0;
};

} // namespace cellar
