#pragma once

#include "waypoint/core/http_request.h"
#include "waypoint/core/http_response.h"
#include "waypoint/core/route_handler.h"

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <functional>
#include <memory>

namespace waypoint::infrastructure::net {

// One HTTP/1.1 connection. Reads a request, hands it to the dispatcher and
// writes back whatever the dispatcher completes with.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    using Tcp = boost::asio::ip::tcp;
    using Request  = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;
    using Dispatcher = std::function<void(core::HttpRequest, core::ResponseCallback)>;

    HttpSession(Tcp::socket socket, Dispatcher dispatcher);

    // Entry point, called by the listener.
    void run();

    // Maps a dispatch result onto the response sent to the client: the
    // handler's response, 400 for an unparseable target, 500 otherwise.
    // A handler status outside 100-999 also becomes a 500.
    static core::HttpResponse to_client_response(boost::system::error_code ec,
                                                 core::HttpResponse res);

private:
    void do_read();
    void on_read(boost::beast::error_code ec, std::size_t bytes);

    void handle_request(Request&& req);
    void on_dispatched(boost::system::error_code ec, core::HttpResponse res);

    void do_write(core::HttpResponse res);
    void on_write(bool close,
                  boost::beast::error_code ec,
                  std::size_t bytes);

    void do_close();

private:
    Tcp::socket socket_;
    Dispatcher dispatcher_;
    boost::beast::flat_buffer buffer_;
    Request request_;
    Response response_;
    unsigned version_ = 11;
    bool keep_alive_ = false;
    bool head_request_ = false;
};

} // namespace waypoint::infrastructure::net
