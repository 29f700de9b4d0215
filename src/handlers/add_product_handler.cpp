#include "larder/handlers/add_product_handler.hpp"
#include "larder/helpers.hpp"
#include "larder/validation.hpp"

namespace larder {
namespace handlers {

Product handle_add_product(const ProductPayload& payload, State& state) {
    // Validate before touching the counter
    validation::validate_product_payload(payload);

    Product product;
    product.id = state.ids.next_id();
    product.name = payload.name;
    product.category = payload.category;
    product.quantity = payload.quantity;
    product.created_at = helpers::now_nanos();

    state.products.insert(product);
    return product;
}

} // namespace handlers
} // namespace larder
