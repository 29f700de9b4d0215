#include "larder/product.hpp"

namespace larder {

const char* category_name(Category category) {
    switch (category) {
        case Category::Bakery: return "Bakery";
        case Category::Cake: return "Cake";
        case Category::Cookies: return "Cookies";
    }
    return "Unknown";
}

bool operator==(const Product& lhs, const Product& rhs) {
    return lhs.id == rhs.id
        && lhs.name == rhs.name
        && lhs.category == rhs.category
        && lhs.quantity == rhs.quantity
        && lhs.created_at == rhs.created_at
        && lhs.updated_at == rhs.updated_at;
}

bool operator!=(const Product& lhs, const Product& rhs) {
    return !(lhs == rhs);
}

} // namespace larder
