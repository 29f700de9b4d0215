#pragma once

#include <cstdint>
#include "larder/inventory.pb.h"
#include "larder/product.hpp"
#include "larder/state.hpp"

namespace larder {

/**
 * Boundary operations of the store.
 *
 * Each call runs to completion against the borrowed State; callers must
 * not issue calls concurrently. Failures are reported as NotFoundError or
 * InvalidOperationError; FatalError subclasses mean the store must stop.
 */
class Inventory {
public:
    explicit Inventory(State& state) : state_(state) {}

    // Reads
    Product get_product(uint64_t id) const;
    uint32_t get_stock(uint64_t id) const;

    // Writes
    Product add_product(const ProductPayload& payload);
    Product update_product(uint64_t id, const ProductPayload& payload);
    Product update_product(uint64_t id, const api::ProductPayload& payload);
    Product add_quantity(uint64_t id, const StockPayload& payload);
    Product offload_quantity(uint64_t id, const StockPayload& payload);
    Product remove_product(uint64_t id);

private:
    Product require_product(uint64_t id) const;

    State& state_;
};

} // namespace larder
