#pragma once

#include <cstdint>
#include "larder/product.hpp"
#include "larder/state.hpp"

namespace larder {
namespace handlers {

/// Handle AddQuantity.
Product handle_add_quantity(uint64_t id, const StockPayload& payload, State& state);

} // namespace handlers
} // namespace larder
