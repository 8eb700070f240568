/**
 * @file errors.hpp
 * @brief Fatal storage errors
 *
 * Every condition in this file aborts the current invocation. Nothing in
 * the library catches these; expected absence is reported through
 * std::optional or null pointers instead.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace cellar {

/**
 * Base class of all storage traps.
 */
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

/// Bytes loaded from storage do not decode as the requested type.
class DecodeError : public StorageError {
public:
    explicit DecodeError(const std::string& what) : StorageError(what) {}
};

/// A lazy container that is not bound to any storage key missed its cache.
class UninitializedAccess : public StorageError {
public:
    explicit UninitializedAccess(const std::string& what) : StorageError(what) {}
};

/// Checked indexing outside of a fixed capacity or current length.
class IndexOutOfBounds : public StorageError {
public:
    explicit IndexOutOfBounds(const std::string& what) : StorageError(what) {}
};

/// Freeing a dynamic allocation that is not currently allocated.
class DoubleFree : public StorageError {
public:
    explicit DoubleFree(const std::string& what) : StorageError(what) {}
};

/// A 32-bit length or index space ran out.
class CapacityExceeded : public StorageError {
public:
    explicit CapacityExceeded(const std::string& what) : StorageError(what) {}
};

/// A container was pushed to a different key than it was pulled from.
class LayoutMismatch : public StorageError {
public:
    explicit LayoutMismatch(const std::string& what) : StorageError(what) {}
};

/// An internal structural invariant was found broken.
class InvariantViolation : public StorageError {
public:
    explicit InvariantViolation(const std::string& what) : StorageError(what) {}
};

} // namespace cellar
