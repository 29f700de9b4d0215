#include "larder/product_repository.hpp"
#include "larder/codec.hpp"

namespace larder {

std::optional<Product> ProductRepository::get(uint64_t id) const {
    auto bytes = records_.get(id);
    if (!bytes) return std::nullopt;
    return codec::decode(*bytes);
}

void ProductRepository::insert(const Product& product) {
    // Encode first so an oversized record leaves the map untouched.
    records_.insert(product.id, codec::encode(product));
}

std::optional<Product> ProductRepository::remove(uint64_t id) {
    auto bytes = records_.remove(id);
    if (!bytes) return std::nullopt;
    return codec::decode(*bytes);
}

} // namespace larder
