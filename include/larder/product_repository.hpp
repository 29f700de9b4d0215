#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include "larder/product.hpp"
#include "larder/storage/backend.hpp"

namespace larder {

/**
 * Keyed access to stored products. Returns copies; does not validate.
 */
class ProductRepository {
public:
    explicit ProductRepository(storage::StableMap& records) : records_(records) {}

    std::optional<Product> get(uint64_t id) const;

    /// Inserts or overwrites the record stored at product.id.
    void insert(const Product& product);

    /// Erases the record and returns what it held.
    std::optional<Product> remove(uint64_t id);

    bool contains(uint64_t id) const { return records_.contains(id); }
    std::size_t size() const { return records_.size(); }

private:
    storage::StableMap& records_;
};

} // namespace larder
