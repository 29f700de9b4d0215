#include "larder/validation.hpp"
#include "larder/codec.hpp"

namespace larder {
namespace validation {

void validate_product_payload(const ProductPayload& payload) {
    require_not_blank(payload.name, "Product name cannot be empty.");
    if (payload.name.size() > codec::MAX_NAME_SIZE) {
        throw InvalidOperationError("Product name cannot exceed " +
                                    std::to_string(codec::MAX_NAME_SIZE) + " bytes.");
    }
    require_positive(payload.quantity, "Product quantity must be greater than zero.");
}

void validate_stock_payload(const StockPayload& payload) {
    require_positive(payload.amount, "Stock amount must be greater than zero.");
}

} // namespace validation
} // namespace larder
