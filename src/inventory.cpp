#include "larder/inventory.hpp"
#include "larder/errors.hpp"
#include "larder/handlers/add_product_handler.hpp"
#include "larder/handlers/add_quantity_handler.hpp"
#include "larder/handlers/offload_quantity_handler.hpp"
#include "larder/handlers/update_product_handler.hpp"

namespace larder {

Product Inventory::require_product(uint64_t id) const {
    auto product = state_.products.get(id);
    if (!product) {
        throw NotFoundError("A product with id=" + std::to_string(id) + " was not found");
    }
    return *product;
}

Product Inventory::get_product(uint64_t id) const {
    return require_product(id);
}

uint32_t Inventory::get_stock(uint64_t id) const {
    return require_product(id).quantity;
}

Product Inventory::add_product(const ProductPayload& payload) {
    return handlers::handle_add_product(payload, state_);
}

Product Inventory::update_product(uint64_t id, const ProductPayload& payload) {
    return handlers::handle_update_product(id, payload, state_);
}

Product Inventory::update_product(uint64_t id, const api::ProductPayload& payload) {
    return handlers::handle_update_product(id, payload, state_);
}

Product Inventory::add_quantity(uint64_t id, const StockPayload& payload) {
    return handlers::handle_add_quantity(id, payload, state_);
}

Product Inventory::offload_quantity(uint64_t id, const StockPayload& payload) {
    return handlers::handle_offload_quantity(id, payload, state_);
}

Product Inventory::remove_product(uint64_t id) {
    auto removed = state_.products.remove(id);
    if (!removed) {
        throw NotFoundError("Couldn't delete a product with id=" + std::to_string(id) +
                            ". Product not found");
    }
    return *removed;
}

} // namespace larder
