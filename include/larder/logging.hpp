#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

namespace larder {

inline std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time_t), "%FT%TZ");
    return ss.str();
}

inline nlohmann::json log_entry(const std::string& level, const std::string& domain,
                                const std::string& message, const nlohmann::json& fields) {
    nlohmann::json entry = {
        {"level", level},
        {"message", message},
        {"domain", domain},
        {"timestamp", now_iso8601()}
    };
    for (auto& [key, value] : fields.items()) {
        entry[key] = value;
    }
    return entry;
}

inline void log_info(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    std::cout << log_entry("info", domain, message, fields).dump() << std::endl;
}

inline void log_error(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    std::cout << log_entry("error", domain, message, fields).dump() << std::endl;
}

}  // namespace larder
