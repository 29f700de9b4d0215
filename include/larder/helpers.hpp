#pragma once

#include <cstdint>
#include <string>

namespace larder {

/**
 * Small helpers shared by the store and the service layer.
 */
namespace helpers {

/**
 * Current wall-clock time in nanoseconds since the Unix epoch.
 */
uint64_t now_nanos();

/**
 * Copy of value without leading and trailing whitespace.
 */
std::string trim(const std::string& value);

/**
 * True if value is empty or whitespace only.
 */
inline bool is_blank(const std::string& value) {
    return trim(value).empty();
}

} // namespace helpers
} // namespace larder
