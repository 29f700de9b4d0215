#include "larder/codec.hpp"
#include "larder/errors.hpp"

namespace larder {
namespace codec {

api::Category to_proto(Category category) {
    switch (category) {
        case Category::Bakery: return api::CATEGORY_BAKERY;
        case Category::Cake: return api::CATEGORY_CAKE;
        case Category::Cookies: return api::CATEGORY_COOKIES;
    }
    throw InternalError("Unknown category value " + std::to_string(static_cast<int>(category)));
}

Category from_proto(api::Category category) {
    switch (category) {
        case api::CATEGORY_BAKERY: return Category::Bakery;
        case api::CATEGORY_CAKE: return Category::Cake;
        case api::CATEGORY_COOKIES: return Category::Cookies;
        default: break;
    }
    throw DecodeError("Unknown category value " + std::to_string(static_cast<int>(category)));
}

api::ProductRecord to_record(const Product& product) {
    api::ProductRecord record;
    record.set_id(product.id);
    record.set_name(product.name);
    record.set_category(to_proto(product.category));
    record.set_quantity(product.quantity);
    record.set_created_at(product.created_at);
    if (product.updated_at) {
        record.set_updated_at(*product.updated_at);
    }
    return record;
}

Product from_record(const api::ProductRecord& record) {
    Product product;
    product.id = record.id();
    product.name = record.name();
    product.category = from_proto(record.category());
    product.quantity = record.quantity();
    product.created_at = record.created_at();
    if (record.has_updated_at()) {
        product.updated_at = record.updated_at();
    }
    return product;
}

ProductPayload from_wire(const api::ProductPayload& payload) {
    ProductPayload result;
    result.name = payload.name();
    result.quantity = payload.quantity();
    try {
        result.category = from_proto(payload.category());
    } catch (const DecodeError&) {
        throw InvalidOperationError("Unknown product category " +
                                    std::to_string(static_cast<int>(payload.category())));
    }
    return result;
}

std::string encode(const Product& product) {
    const auto record = to_record(product);
    const auto size = record.ByteSizeLong();
    if (size > MAX_ENCODED_SIZE) {
        throw EncodeError("Product with id=" + std::to_string(product.id) + " encodes to " +
                          std::to_string(size) + " bytes, limit is " +
                          std::to_string(MAX_ENCODED_SIZE));
    }

    std::string bytes;
    if (!record.SerializeToString(&bytes)) {
        throw EncodeError("Failed to serialize product with id=" + std::to_string(product.id));
    }
    return bytes;
}

Product decode(const std::string& bytes) {
    if (bytes.size() > MAX_ENCODED_SIZE) {
        throw DecodeError("Stored record of " + std::to_string(bytes.size()) +
                          " bytes exceeds limit of " + std::to_string(MAX_ENCODED_SIZE));
    }

    api::ProductRecord record;
    if (!record.ParseFromString(bytes)) {
        throw DecodeError("Stored record is not a valid ProductRecord");
    }
    return from_record(record);
}

} // namespace codec
} // namespace larder
