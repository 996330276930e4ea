#include "waypoint/infrastructure/net/http_session.h"

#include "waypoint/core/error.h"
#include "waypoint/core/http_method.h"

#include <boost/beast/http.hpp>
#include <iostream>
#include <string>
#include <string_view>

namespace waypoint::infrastructure::net {

namespace http = boost::beast::http;

HttpSession::HttpSession(Tcp::socket socket, Dispatcher dispatcher)
    : socket_(std::move(socket))
    , dispatcher_(std::move(dispatcher)) {}

void HttpSession::run() {
    // The socket's executor is a strand; start on it.
    boost::asio::dispatch(
        socket_.get_executor(),
        boost::beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
}

core::HttpResponse HttpSession::to_client_response(boost::system::error_code ec,
                                                   core::HttpResponse res) {
    if (!ec) {
        // Beast only serializes three-digit status codes.
        if (res.status() < 100 || res.status() > 999) {
            return core::HttpResponse::error("internal server error", 500);
        }
        return res;
    }
    if (ec == core::errc::bad_request_target) {
        return core::HttpResponse::error("bad request", 400);
    }
    return core::HttpResponse::error("internal server error", 500);
}

void HttpSession::do_read() {
    request_ = {};

    http::async_read(
        socket_,
        buffer_,
        request_,
        boost::beast::bind_front_handler(
            &HttpSession::on_read,
            shared_from_this()));
}

void HttpSession::on_read(boost::beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        return do_close();
    }

    if (ec) {
        std::cerr << "[HttpSession] read error: " << ec.message() << std::endl;
        return;
    }

    handle_request(std::move(request_));
}

void HttpSession::handle_request(Request&& req) {
    version_ = req.version();
    keep_alive_ = req.keep_alive();
    head_request_ = req.method() == http::verb::head;

    auto method_string = req.method_string();
    auto method = core::parse_method(std::string_view(method_string.data(), method_string.size()));
    if (!method) {
        return do_write(core::HttpResponse::error("not implemented", 501));
    }

    auto target = req.target();
    core::HttpRequest request(*method, std::string(target.data(), target.size()));
    for (const auto& field : req) {
        auto name = field.name_string();
        auto value = field.value();
        request.set_header(std::string(name.data(), name.size()),
                           std::string(value.data(), value.size()));
    }
    request.set_body(std::move(req.body()));

    // Handlers may complete on any thread; hop back onto the strand.
    dispatcher_(
        std::move(request),
        [self = shared_from_this()](boost::system::error_code ec, core::HttpResponse res) {
            boost::asio::post(
                self->socket_.get_executor(),
                [self, ec, res = std::move(res)]() mutable {
                    self->on_dispatched(ec, std::move(res));
                });
        });
}

void HttpSession::on_dispatched(boost::system::error_code ec, core::HttpResponse res) {
    if (ec) {
        std::cerr << "[HttpSession] dispatch failed: " << ec.message() << std::endl;
    }
    do_write(to_client_response(ec, std::move(res)));
}

void HttpSession::do_write(core::HttpResponse res) {
    response_ = {};
    response_.version(version_);
    response_.keep_alive(keep_alive_);
    response_.result(static_cast<unsigned>(res.status()));
    response_.set(http::field::server, "waypoint");
    for (const auto& [name, value] : res.headers()) {
        response_.set(name, value);
    }
    response_.body() = res.body();
    response_.prepare_payload();
    if (head_request_) {
        // Keep the Content-Length a GET would have had, send no body.
        response_.body().clear();
    }

    auto close = response_.need_eof();

    http::async_write(
        socket_,
        response_,
        boost::beast::bind_front_handler(
            &HttpSession::on_write,
            shared_from_this(),
            close));
}

void HttpSession::on_write(bool close,
                           boost::beast::error_code ec,
                           std::size_t) {
    if (ec) {
        std::cerr << "[HttpSession] write error: " << ec.message() << std::endl;
        return;
    }

    if (close) {
        return do_close();
    }

    do_read();
}

void HttpSession::do_close() {
    boost::beast::error_code ec;
    socket_.shutdown(Tcp::socket::shutdown_send, ec);
    if (ec && ec != boost::asio::error::not_connected) {
        std::cerr << "[HttpSession] shutdown error: " << ec.message() << std::endl;
    }
}

} // namespace waypoint::infrastructure::net
