#include "larder/handlers/add_quantity_handler.hpp"
#include "larder/errors.hpp"
#include "larder/helpers.hpp"
#include "larder/validation.hpp"

#include <limits>

namespace larder {
namespace handlers {

Product handle_add_quantity(uint64_t id, const StockPayload& payload, State& state) {
    // Guard
    auto existing = state.products.get(id);
    if (!existing) {
        throw NotFoundError("Couldn't add quantity to product with id=" + std::to_string(id) +
                            ". Product not found");
    }

    // Validate
    validation::validate_stock_payload(payload);

    // Compute
    Product product = std::move(*existing);
    if (payload.amount > std::numeric_limits<uint32_t>::max() - product.quantity) {
        throw InternalError("Quantity overflow for product with id=" + std::to_string(id) +
                            ". Current: " + std::to_string(product.quantity) +
                            ", Trying to add: " + std::to_string(payload.amount));
    }
    product.quantity += payload.amount;
    product.updated_at = helpers::now_nanos();

    state.products.insert(product);
    return product;
}

} // namespace handlers
} // namespace larder
