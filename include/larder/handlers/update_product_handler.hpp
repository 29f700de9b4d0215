#pragma once

#include <cstdint>
#include "larder/inventory.pb.h"
#include "larder/product.hpp"
#include "larder/state.hpp"

namespace larder {
namespace handlers {

/// Handle UpdateProduct.
Product handle_update_product(uint64_t id, const ProductPayload& payload, State& state);

/// Handle UpdateProduct from a request payload. The id is resolved before
/// the payload is converted, so a missing id wins over a bad category.
Product handle_update_product(uint64_t id, const api::ProductPayload& payload, State& state);

} // namespace handlers
} // namespace larder
