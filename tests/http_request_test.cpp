#include "waypoint/core/http_request.h"
#include "waypoint/core/http_response.h"

#include <gtest/gtest.h>

namespace waypoint::core {

TEST(HttpRequestTest, DefaultsToGetRoot) {
    HttpRequest req;

    EXPECT_EQ(req.method(), HttpMethod::Get);
    EXPECT_EQ(req.target(), "/");
    EXPECT_EQ(req.url().path(), "/");
}

TEST(HttpRequestTest, HeadersAreCaseInsensitive) {
    HttpRequest req(HttpMethod::Post, "/upload");
    req.set_header("Content-Type", "text/plain");

    EXPECT_TRUE(req.has_header("content-type"));
    EXPECT_TRUE(req.has_header("CONTENT-TYPE"));
    EXPECT_EQ(req.header("Content-type"), "text/plain");
    EXPECT_FALSE(req.has_header("Accept"));
    EXPECT_EQ(req.header("Accept"), "");
}

TEST(HttpRequestTest, UrlParsesTarget) {
    HttpRequest req(HttpMethod::Get, "/items?page=3");

    auto url = req.url();
    EXPECT_EQ(url.path(), "/items");
    EXPECT_EQ(url.query_param("page"), "3");
}

TEST(HttpRequestTest, UrlOfBadTarget) {
    HttpRequest req(HttpMethod::Get, "/broken%");

    EXPECT_THROW(req.url(), UrlParseError);

    boost::system::error_code ec;
    req.url(ec);
    EXPECT_TRUE(ec);
}

TEST(HttpRequestTest, PathParams) {
    HttpRequest req;
    req.set_path_params({{"id", "42"}});

    EXPECT_EQ(req.path_param("id"), "42");
    EXPECT_EQ(req.path_param("other"), "");
    EXPECT_EQ(req.path_params().size(), 1u);
}

TEST(HttpResponseTest, Factories) {
    auto ok = HttpResponse::ok("hello");
    EXPECT_EQ(ok.status(), 200);
    EXPECT_EQ(ok.body(), "hello");
    EXPECT_EQ(ok.header("Content-Type"), "text/plain");

    auto err = HttpResponse::error("nope", 418);
    EXPECT_EQ(err.status(), 418);
    EXPECT_EQ(err.body(), "nope");
}

TEST(HttpResponseTest, JsonHelper) {
    HttpResponse res;
    res.set_json("{}");

    EXPECT_EQ(res.status(), 200);
    EXPECT_EQ(res.header("Content-Type"), "application/json");
    EXPECT_EQ(res.body(), "{}");
}

} // namespace waypoint::core
