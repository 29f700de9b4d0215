#include "larder/handlers/offload_quantity_handler.hpp"
#include "larder/errors.hpp"
#include "larder/helpers.hpp"
#include "larder/validation.hpp"

namespace larder {
namespace handlers {

namespace {

void guard_available(uint64_t id, const Product& product, uint32_t amount) {
    if (product.quantity == 0) {
        throw InvalidOperationError("Product with id=" + std::to_string(id) +
                                    " cannot be offloaded because the quantity is 0");
    }
    if (amount > product.quantity) {
        throw InvalidOperationError("Cannot offload more than available quantity. Available: " +
                                    std::to_string(product.quantity) +
                                    ", Trying to offload: " + std::to_string(amount));
    }
}

} // anonymous namespace

Product handle_offload_quantity(uint64_t id, const StockPayload& payload, State& state) {
    // Guard
    auto existing = state.products.get(id);
    if (!existing) {
        throw NotFoundError("Couldn't offload a product with id=" + std::to_string(id) +
                            ". Product not found");
    }

    // Validate
    validation::validate_stock_payload(payload);
    guard_available(id, *existing, payload.amount);

    // Compute. Both guards above have passed, amount <= quantity.
    Product product = std::move(*existing);
    product.quantity -= payload.amount;
    product.updated_at = helpers::now_nanos();

    state.products.insert(product);
    return product;
}

} // namespace handlers
} // namespace larder
