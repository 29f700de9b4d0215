#pragma once

#include <cstdint>
#include "larder/storage/backend.hpp"

namespace larder {

/**
 * Hands out strictly increasing product ids backed by a persistent counter.
 *
 * The counter is written before the id is returned, so a failed write
 * (StorageError) never yields an id that could be handed out again.
 */
class IdAllocator {
public:
    explicit IdAllocator(storage::StableCell& counter) : counter_(counter) {}

    uint64_t next_id();

    /// Last id handed out; 0 on a fresh store.
    uint64_t current() const { return counter_.get(); }

private:
    storage::StableCell& counter_;
};

} // namespace larder
