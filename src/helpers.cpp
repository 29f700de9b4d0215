#include "larder/helpers.hpp"

#include <chrono>
#include <cctype>

namespace larder {
namespace helpers {

uint64_t now_nanos() {
    auto time_point = std::chrono::system_clock::now();
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(time_point.time_since_epoch());
    return static_cast<uint64_t>(nanos.count());
}

std::string trim(const std::string& value) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    std::string::size_type begin = 0;
    while (begin < value.size() && is_space(value[begin])) ++begin;

    std::string::size_type end = value.size();
    while (end > begin && is_space(value[end - 1])) --end;

    return value.substr(begin, end - begin);
}

} // namespace helpers
} // namespace larder
