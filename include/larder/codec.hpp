#pragma once

#include <cstddef>
#include <string>
#include "larder/product.hpp"
#include "larder/inventory.pb.h"
#include "larder/types.pb.h"

namespace larder {

/**
 * Conversions between Product and its stored protobuf form.
 */
namespace codec {

/**
 * Upper bound on the encoded size of a single record, in bytes.
 */
constexpr std::size_t MAX_ENCODED_SIZE = 1024;

/**
 * Room reserved for every field but the name: tags, length prefixes and
 * worst-case varints for id, quantity and both timestamps.
 */
constexpr std::size_t MAX_RECORD_OVERHEAD = 64;

/**
 * Longest name, in bytes, that always fits within MAX_ENCODED_SIZE.
 */
constexpr std::size_t MAX_NAME_SIZE = MAX_ENCODED_SIZE - MAX_RECORD_OVERHEAD;

api::Category to_proto(Category category);
Category from_proto(api::Category category);

api::ProductRecord to_record(const Product& product);
Product from_record(const api::ProductRecord& record);

/**
 * Converts a request payload. Throws InvalidOperationError for a category
 * outside the closed set.
 */
ProductPayload from_wire(const api::ProductPayload& payload);

/**
 * Serializes a product. Throws EncodeError if the result would exceed
 * MAX_ENCODED_SIZE; nothing is truncated.
 */
std::string encode(const Product& product);

/**
 * Parses stored bytes. Throws DecodeError on malformed or oversized input.
 */
Product decode(const std::string& bytes);

} // namespace codec
} // namespace larder
