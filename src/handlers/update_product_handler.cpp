#include "larder/handlers/update_product_handler.hpp"
#include "larder/codec.hpp"
#include "larder/errors.hpp"
#include "larder/helpers.hpp"
#include "larder/validation.hpp"

namespace larder {
namespace handlers {

namespace {

Product guard(uint64_t id, const State& state) {
    auto existing = state.products.get(id);
    if (!existing) {
        throw NotFoundError("Couldn't update a product with id=" + std::to_string(id) +
                            ". Product not found");
    }
    return std::move(*existing);
}

Product apply(Product product, const ProductPayload& payload, State& state) {
    // Validate
    validation::validate_product_payload(payload);

    // Compute
    product.name = payload.name;
    product.category = payload.category;
    product.quantity = payload.quantity;
    product.updated_at = helpers::now_nanos();

    state.products.insert(product);
    return product;
}

} // anonymous namespace

Product handle_update_product(uint64_t id, const ProductPayload& payload, State& state) {
    return apply(guard(id, state), payload, state);
}

Product handle_update_product(uint64_t id, const api::ProductPayload& payload, State& state) {
    auto existing = guard(id, state);
    return apply(std::move(existing), codec::from_wire(payload), state);
}

} // namespace handlers
} // namespace larder
