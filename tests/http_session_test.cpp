#include "waypoint/core/error.h"
#include "waypoint/core/http_router.h"
#include "waypoint/infrastructure/net/http_session.h"
#include "waypoint/infrastructure/net/listener.h"

#include <gtest/gtest.h>

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include <memory>
#include <string>
#include <thread>

namespace waypoint::infrastructure::net {

namespace http = boost::beast::http;

namespace {

struct EmptyState {};

using StatePtr = std::shared_ptr<const EmptyState>;
using ClientResponse = http::response<http::string_body>;

} // namespace

class HttpSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        router_.get(core::path("/hello"), [](core::HttpRequest, StatePtr, core::ResponseCallback done) {
                  done({}, core::HttpResponse::ok("hello"));
              })
            .get(core::path("/users/:id"), [](core::HttpRequest req, StatePtr, core::ResponseCallback done) {
                done({}, core::HttpResponse::ok("user " + req.path_param("id")));
            })
            .get(core::path("/later"), [this](core::HttpRequest, StatePtr, core::ResponseCallback done) {
                boost::asio::post(workers_, [done] {
                    done({}, core::HttpResponse::ok("later"));
                });
            })
            .get(core::path("/fail"), [](core::HttpRequest, StatePtr, core::ResponseCallback done) {
                done(core::errc::handler_failed, {});
            })
            .get(core::path("/teapot"), [](core::HttpRequest, StatePtr, core::ResponseCallback done) {
                done({}, core::HttpResponse::error("too big", 1000));
            })
            .head(core::path("/hello"), [](core::HttpRequest, StatePtr, core::ResponseCallback done) {
                done({}, core::HttpResponse::ok("hello"));
            })
            .post(core::path("/echo"), [](core::HttpRequest req, StatePtr, core::ResponseCallback done) {
                auto res = core::HttpResponse::ok(req.body());
                res.set_header("X-Seen-Type", req.header("content-type"));
                done({}, std::move(res));
            });

        listener_ = std::make_shared<Listener>(
            server_context_,
            Listener::Tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0),
            [this](Listener::Tcp::socket socket) {
                return std::make_shared<HttpSession>(
                    std::move(socket),
                    [this](core::HttpRequest req, core::ResponseCallback done) {
                        router_.run(std::move(req), std::move(done));
                    });
            });
        endpoint_ = listener_->local_endpoint();
        listener_->run();

        server_thread_ = std::thread([this] { server_context_.run(); });
    }

    void TearDown() override {
        listener_->stop();
        server_context_.stop();
        server_thread_.join();
        workers_.join();
    }

    ClientResponse send(http::request<http::string_body> req) {
        boost::asio::io_context context;
        Listener::Tcp::socket socket(context);
        socket.connect(endpoint_);

        req.set(http::field::host, "localhost");
        req.prepare_payload();
        http::write(socket, req);

        boost::beast::flat_buffer buffer;
        ClientResponse res;
        http::read(socket, buffer, res);

        boost::system::error_code ec;
        socket.shutdown(Listener::Tcp::socket::shutdown_both, ec);
        return res;
    }

    ClientResponse get(const std::string& target) {
        return send(http::request<http::string_body>(http::verb::get, target, 11));
    }

    core::HttpRouter<EmptyState> router_{std::make_shared<const EmptyState>()};
    boost::asio::thread_pool workers_{1};
    boost::asio::io_context server_context_;
    std::shared_ptr<Listener> listener_;
    Listener::Tcp::endpoint endpoint_;
    std::thread server_thread_;
};

TEST_F(HttpSessionTest, ServesMatchedRoute) {
    auto res = get("/hello");

    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), "hello");
    EXPECT_EQ(res[http::field::server], "waypoint");
    EXPECT_EQ(res[http::field::content_type], "text/plain");
}

TEST_F(HttpSessionTest, PathParamsReachHandler) {
    auto res = get("/users/42");

    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), "user 42");
}

TEST_F(HttpSessionTest, UnmatchedRouteIsNotFound) {
    auto res = get("/goodbye");

    EXPECT_EQ(res.result(), http::status::not_found);
    EXPECT_EQ(res.body(), "page not found");
}

TEST_F(HttpSessionTest, MethodMismatchIsNotFound) {
    auto res = send(http::request<http::string_body>(http::verb::post, "/hello", 11));

    EXPECT_EQ(res.result(), http::status::not_found);
}

TEST_F(HttpSessionTest, HandlerCompletingOnAnotherThread) {
    auto res = get("/later");

    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), "later");
}

TEST_F(HttpSessionTest, HandlerFailureIsServerError) {
    EXPECT_EQ(get("/fail").result(), http::status::internal_server_error);
}

TEST_F(HttpSessionTest, BadTargetIsBadRequest) {
    EXPECT_EQ(get("/bad%zz").result(), http::status::bad_request);
}

TEST_F(HttpSessionTest, UnknownMethodIsNotImplemented) {
    http::request<http::string_body> req;
    req.method_string("BREW");
    req.target("/hello");
    req.version(11);

    EXPECT_EQ(send(std::move(req)).result(), http::status::not_implemented);
}

TEST_F(HttpSessionTest, RequestBodyAndHeadersReachHandler) {
    http::request<http::string_body> req(http::verb::post, "/echo", 11);
    req.set(http::field::content_type, "application/json");
    req.body() = "{\"a\":1}";

    auto res = send(std::move(req));
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), "{\"a\":1}");
    EXPECT_EQ(res["X-Seen-Type"], "application/json");
}

TEST_F(HttpSessionTest, OutOfRangeStatusBecomesServerError) {
    auto res = get("/teapot");

    EXPECT_EQ(res.result(), http::status::internal_server_error);
}

TEST_F(HttpSessionTest, HeadResponseCarriesNoBody) {
    boost::asio::io_context context;
    Listener::Tcp::socket socket(context);
    socket.connect(endpoint_);

    // The HEAD response is followed by a GET on the same connection: any
    // stray body bytes would corrupt the second response.
    http::request<http::string_body> head(http::verb::head, "/hello", 11);
    head.set(http::field::host, "localhost");
    http::write(socket, head);

    boost::beast::flat_buffer buffer;
    http::response_parser<http::empty_body> parser;
    parser.skip(true);
    http::read(socket, buffer, parser);

    auto& res = parser.get();
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_length], "5");

    http::request<http::string_body> follow_up(http::verb::get, "/hello", 11);
    follow_up.set(http::field::host, "localhost");
    http::write(socket, follow_up);

    ClientResponse next;
    http::read(socket, buffer, next);
    EXPECT_EQ(next.result(), http::status::ok);
    EXPECT_EQ(next.body(), "hello");

    boost::system::error_code ec;
    socket.shutdown(Listener::Tcp::socket::shutdown_both, ec);
}

TEST_F(HttpSessionTest, KeepAliveServesSeveralRequests) {
    boost::asio::io_context context;
    Listener::Tcp::socket socket(context);
    socket.connect(endpoint_);
    boost::beast::flat_buffer buffer;

    for (const char* target : {"/hello", "/users/7", "/nowhere"}) {
        http::request<http::string_body> req(http::verb::get, target, 11);
        req.set(http::field::host, "localhost");
        http::write(socket, req);

        ClientResponse res;
        http::read(socket, buffer, res);
        EXPECT_TRUE(res.keep_alive()) << target;
    }

    boost::system::error_code ec;
    socket.shutdown(Listener::Tcp::socket::shutdown_both, ec);
}

TEST(HttpSessionMappingTest, DispatchErrorsBecomeStatusCodes) {
    auto ok = HttpSession::to_client_response({}, core::HttpResponse::ok("fine"));
    EXPECT_EQ(ok.status(), 200);
    EXPECT_EQ(ok.body(), "fine");

    auto bad = HttpSession::to_client_response(core::errc::bad_request_target, {});
    EXPECT_EQ(bad.status(), 400);

    auto failed = HttpSession::to_client_response(
        boost::asio::error::connection_reset, {});
    EXPECT_EQ(failed.status(), 500);

    EXPECT_EQ(HttpSession::to_client_response({}, core::HttpResponse::error("x", 1000)).status(), 500);
    EXPECT_EQ(HttpSession::to_client_response({}, core::HttpResponse::error("x", 42)).status(), 500);
    EXPECT_EQ(HttpSession::to_client_response({}, core::HttpResponse::error("x", 999)).status(), 999);
}

} // namespace waypoint::infrastructure::net
