#pragma once

#include <boost/asio.hpp>
#include <atomic>
#include <functional>
#include <memory>

namespace waypoint::infrastructure::net {

class HttpSession;

class Listener : public std::enable_shared_from_this<Listener> {
public:
    using Tcp = boost::asio::ip::tcp;
    using SessionFactory =
        std::function<std::shared_ptr<HttpSession>(Tcp::socket)>;

    // Picks the io_context an accepted connection will live on.
    using ContextProvider = std::function<boost::asio::io_context&()>;

    // Throws std::runtime_error if the endpoint cannot be bound. Without a
    // context provider, connections stay on the listener's io_context.
    Listener(
        boost::asio::io_context& io_context,
        const Tcp::endpoint& endpoint,
        SessionFactory session_factory,
        ContextProvider context_provider = {}
    );

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    // Starts the accept loop.
    void run();

    // Stops accepting; sessions already running are left alone.
    void stop();

    // The bound endpoint, useful after binding to port 0.
    Tcp::endpoint local_endpoint() const;

private:
    void do_accept();

    boost::asio::io_context& io_context_;
    Tcp::acceptor acceptor_;
    SessionFactory session_factory_;
    ContextProvider context_provider_;
    std::atomic<bool> stopped_{false};
};

} // namespace waypoint::infrastructure::net
