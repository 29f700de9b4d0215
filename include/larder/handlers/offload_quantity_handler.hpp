#pragma once

#include <cstdint>
#include "larder/product.hpp"
#include "larder/state.hpp"

namespace larder {
namespace handlers {

/// Handle OffloadQuantity. Rejects any amount that would take stock below zero.
Product handle_offload_quantity(uint64_t id, const StockPayload& payload, State& state);

} // namespace handlers
} // namespace larder
