#pragma once

#include <filesystem>
#include <string>

namespace larder {

constexpr int DEFAULT_PORT = 50051;
constexpr const char* DEFAULT_BIND_ADDRESS = "0.0.0.0";
constexpr const char* DEFAULT_DATA_DIR = "./larder-data";

/**
 * Server settings.
 *
 * Read from PORT, LARDER_BIND_ADDRESS and LARDER_DATA_DIR. A port given as
 * the first command-line argument overrides PORT.
 */
struct Config {
    std::string bind_address = DEFAULT_BIND_ADDRESS;
    int port = DEFAULT_PORT;
    std::filesystem::path data_dir = DEFAULT_DATA_DIR;

    std::string server_address() const {
        return bind_address + ":" + std::to_string(port);
    }

    /// Throws ConfigError on a malformed or out-of-range port.
    static Config load(int argc, char** argv);
};

/// Parses a TCP port in [1, 65535]. Throws ConfigError otherwise.
int parse_port(const std::string& value);

} // namespace larder
