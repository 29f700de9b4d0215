#pragma once

#include "larder/product.hpp"
#include "larder/state.hpp"

namespace larder {
namespace handlers {

/// Handle AddProduct: validate, allocate an id, store the new record.
Product handle_add_product(const ProductPayload& payload, State& state);

} // namespace handlers
} // namespace larder
