#include "waypoint/app/server_config.h"
#include "waypoint/core/error.h"
#include "waypoint/core/http_router.h"
#include "waypoint/infrastructure/net/http_session.h"
#include "waypoint/infrastructure/net/io_context_pool.h"
#include "waypoint/infrastructure/net/listener.h"

#include <boost/asio/signal_set.hpp>

#include <atomic>
#include <csignal>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

namespace {

using namespace waypoint;

struct ServerState {
    // Shared by every request; the router hands out const access only.
    mutable std::atomic<std::uint64_t> hits{0};
};

using StatePtr = std::shared_ptr<const ServerState>;

void get_hello(core::HttpRequest, StatePtr, core::ResponseCallback done) {
    done({}, core::HttpResponse::ok("hello"));
}

void get_user(core::HttpRequest req, StatePtr, core::ResponseCallback done) {
    done({}, core::HttpResponse::ok("user " + req.path_param("id")));
}

void get_hits(core::HttpRequest, StatePtr state, core::ResponseCallback done) {
    auto hits = state->hits.fetch_add(1, std::memory_order_relaxed) + 1;
    core::HttpResponse res;
    res.set_json("{\"hits\":" + std::to_string(hits) + "}");
    done({}, std::move(res));
}

void post_echo(core::HttpRequest req, StatePtr, core::ResponseCallback done) {
    if (req.body().empty()) {
        done(core::errc::handler_failed, {});
        return;
    }
    core::HttpResponse res = core::HttpResponse::ok(req.body());
    auto content_type = req.header("Content-Type");
    if (!content_type.empty()) {
        res.set_header("Content-Type", content_type);
    }
    done({}, std::move(res));
}

int serve(const app::ServerConfig& config) {
    auto state = std::make_shared<const ServerState>();

    auto router = core::HttpRouter<ServerState>::with_state(state)
        .get(core::path("/hello"), get_hello)
        .get(core::path("/users/:id"), get_user)
        .get(core::path("/hits"), get_hits)
        .post(core::path("/echo"), post_echo);

    infrastructure::net::IoContextPool pool(config.threads);
    auto& listen_context = pool.next_context();

    auto dispatcher = [&router](core::HttpRequest req, core::ResponseCallback done) {
        router.run(std::move(req), std::move(done));
    };

    auto listener = std::make_shared<infrastructure::net::Listener>(
        listen_context,
        infrastructure::net::Listener::Tcp::endpoint(
            boost::asio::ip::make_address(config.address), config.port),
        [dispatcher](infrastructure::net::Listener::Tcp::socket socket) {
            return std::make_shared<infrastructure::net::HttpSession>(std::move(socket), dispatcher);
        },
        [&pool]() -> boost::asio::io_context& { return pool.next_context(); });

    std::cerr << "[waypoint_server] listening on " << listener->local_endpoint()
              << " with " << pool.size() << " thread(s), " << router.size() << " route(s)"
              << std::endl;

    boost::asio::io_context signals_context;
    boost::asio::signal_set signals(signals_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            std::cerr << "[waypoint_server] signal " << signo << ", shutting down" << std::endl;
        }
        listener->stop();
    });

    listener->run();
    pool.start();
    signals_context.run();
    pool.stop();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        auto config = waypoint::app::parse_server_config(argc, argv);
        if (!config) {
            return 0;
        }
        return serve(*config);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[waypoint_server] " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[waypoint_server] fatal: " << e.what() << std::endl;
        return 1;
    }
}
