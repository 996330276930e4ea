#include "waypoint/app/server_config.h"

#include <boost/asio/ip/address.hpp>
#include <boost/program_options.hpp>

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace waypoint::app {

namespace po = boost::program_options;

std::optional<ServerConfig> parse_server_config(int argc, const char* const argv[]) {
    ServerConfig config;
    config.threads = std::max<std::size_t>(1, std::thread::hardware_concurrency());

    po::options_description desc("waypoint_server options");
    desc.add_options()
        ("help,h", "print this help and exit")
        ("address,a", po::value<std::string>(&config.address)->default_value(config.address),
            "address to listen on")
        ("port,p", po::value<std::uint16_t>(&config.port)->default_value(config.port),
            "TCP port to listen on")
        ("threads,t", po::value<std::size_t>(&config.threads)->default_value(config.threads),
            "number of I/O threads");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw std::invalid_argument(e.what());
    }

    if (vm.count("help")) {
        std::cout << desc << std::endl;
        return std::nullopt;
    }

    if (config.threads == 0) {
        throw std::invalid_argument("--threads must be at least 1");
    }

    boost::system::error_code ec;
    boost::asio::ip::make_address(config.address, ec);
    if (ec) {
        throw std::invalid_argument("invalid --address '" + config.address + "': " + ec.message());
    }

    return config;
}

} // namespace waypoint::app
