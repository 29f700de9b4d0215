#pragma once

#include <string>
#include "larder/errors.hpp"
#include "larder/helpers.hpp"
#include "larder/product.hpp"

namespace larder {
namespace validation {

/**
 * Require that a string holds something other than whitespace.
 */
inline void require_not_blank(const std::string& value, const std::string& message) {
    if (helpers::is_blank(value)) {
        throw InvalidOperationError(message);
    }
}

/**
 * Require that a value is positive (greater than zero).
 */
template<typename T>
void require_positive(T value, const std::string& message) {
    if (value <= 0) {
        throw InvalidOperationError(message);
    }
}

/**
 * Payload rules shared by product creation and update.
 */
void validate_product_payload(const ProductPayload& payload);

/**
 * Payload rules shared by stock increase and decrease.
 */
void validate_stock_payload(const StockPayload& payload);

} // namespace validation
} // namespace larder
