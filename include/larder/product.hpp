#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace larder {

/// Closed set of product categories. Bakery is the default.
enum class Category { Bakery, Cake, Cookies };

/// Returns the display name of a category ("Bakery", "Cake", "Cookies").
const char* category_name(Category category);

/// A stored inventory record. Timestamps are nanoseconds since the Unix epoch.
struct Product {
    uint64_t id = 0;
    std::string name;
    Category category = Category::Bakery;
    uint32_t quantity = 0;
    uint64_t created_at = 0;
    std::optional<uint64_t> updated_at;
};

bool operator==(const Product& lhs, const Product& rhs);
bool operator!=(const Product& lhs, const Product& rhs);

/// Payload for creating or replacing a product.
struct ProductPayload {
    std::string name;
    uint32_t quantity = 0;
    Category category = Category::Bakery;
};

/// Payload for adding or removing stock.
struct StockPayload {
    uint32_t amount = 0;
};

} // namespace larder
