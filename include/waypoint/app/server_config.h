#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace waypoint::app {

struct ServerConfig {
    std::string address = "0.0.0.0";
    std::uint16_t port = 8080;
    std::size_t threads = 1;
};

// Parses --address, --port, --threads and --help.
// Returns nullopt when --help was given (the usage has been printed).
// Throws std::invalid_argument on a bad option or value.
std::optional<ServerConfig> parse_server_config(int argc, const char* const argv[]);

} // namespace waypoint::app
