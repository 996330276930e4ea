#include "waypoint/infrastructure/net/listener.h"
#include "waypoint/infrastructure/net/http_session.h"

#include <iostream>
#include <stdexcept>
#include <string>

namespace waypoint::infrastructure::net {

namespace {

void throw_if(const boost::system::error_code& ec, const char* what) {
    if (ec) {
        throw std::runtime_error(std::string("Listener: ") + what + " failed: " + ec.message());
    }
}

} // namespace

Listener::Listener(
    boost::asio::io_context& io_context,
    const Tcp::endpoint& endpoint,
    SessionFactory session_factory,
    ContextProvider context_provider
)
    : io_context_(io_context)
    , acceptor_(io_context)
    , session_factory_(std::move(session_factory))
    , context_provider_(std::move(context_provider))
{
    boost::system::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    throw_if(ec, "open");

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    throw_if(ec, "set_option");

    acceptor_.bind(endpoint, ec);
    throw_if(ec, "bind");

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    throw_if(ec, "listen");
}

void Listener::run() {
    if (stopped_) {
        return;
    }
    do_accept();
}

void Listener::stop() {
    bool expected = false;
    if (!stopped_.compare_exchange_strong(expected, true)) {
        return;
    }

    // Runs on the acceptor's context so it never races a pending accept.
    boost::asio::post(io_context_, [self = shared_from_this()] {
        boost::system::error_code ec;
        self->acceptor_.cancel(ec);
        self->acceptor_.close(ec);
    });
}

Listener::Tcp::endpoint Listener::local_endpoint() const {
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    throw_if(ec, "local_endpoint");
    return endpoint;
}

void Listener::do_accept() {
    auto& session_context = context_provider_ ? context_provider_() : io_context_;

    acceptor_.async_accept(
        boost::asio::make_strand(session_context),
        [self = shared_from_this()](boost::system::error_code ec,
                                    Tcp::socket socket) {
            if (self->stopped_) {
                return;
            }

            if (ec) {
                std::cerr << "[Listener] accept error: " << ec.message() << std::endl;
            } else {
                try {
                    auto session = self->session_factory_(std::move(socket));
                    session->run();
                } catch (const std::exception& e) {
                    std::cerr << "[Listener] session setup failed: " << e.what() << std::endl;
                }
            }

            self->do_accept();
        }
    );
}

} // namespace waypoint::infrastructure::net
