#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace larder {
namespace storage {

/**
 * Persistent ordered mapping from a 64-bit key to an opaque byte payload.
 */
class StableMap {
public:
    virtual ~StableMap() = default;

    virtual std::optional<std::string> get(uint64_t key) const = 0;

    /**
     * Inserts or overwrites the payload stored at key.
     */
    virtual void insert(uint64_t key, const std::string& value) = 0;

    /**
     * Erases key and returns the payload it held.
     */
    virtual std::optional<std::string> remove(uint64_t key) = 0;

    virtual bool contains(uint64_t key) const = 0;
    virtual std::size_t size() const = 0;
};

/**
 * Persistent scalar cell holding a single unsigned 64-bit value.
 */
class StableCell {
public:
    virtual ~StableCell() = default;

    virtual uint64_t get() const = 0;
    virtual void set(uint64_t value) = 0;
};

/**
 * Durable key-value backend: the counter cell and the record map.
 * Implementations throw StorageError when state cannot be persisted.
 */
class Backend {
public:
    virtual ~Backend() = default;

    virtual StableCell& counter() = 0;
    virtual StableMap& records() = 0;
};

} // namespace storage
} // namespace larder
