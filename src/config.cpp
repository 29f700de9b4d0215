#include "larder/config.hpp"
#include "larder/errors.hpp"

#include <cstdlib>

namespace larder {

int parse_port(const std::string& value) {
    std::size_t consumed = 0;
    int port = 0;
    try {
        port = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigError("Invalid port: '" + value + "'");
    }
    if (consumed != value.size() || port <= 0 || port > 65535) {
        throw ConfigError("Invalid port: '" + value + "'");
    }
    return port;
}

Config Config::load(int argc, char** argv) {
    Config config;

    if (const char* address = std::getenv("LARDER_BIND_ADDRESS")) {
        config.bind_address = address;
    }
    if (const char* data_dir = std::getenv("LARDER_DATA_DIR")) {
        config.data_dir = data_dir;
    }
    if (const char* port_env = std::getenv("PORT")) {
        config.port = parse_port(port_env);
    }
    if (argc > 1) {
        config.port = parse_port(argv[1]);
    }
    return config;
}

} // namespace larder
