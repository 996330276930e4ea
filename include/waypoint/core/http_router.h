#pragma once

#include "waypoint/core/http_method.h"
#include "waypoint/core/http_request.h"
#include "waypoint/core/http_response.h"
#include "waypoint/core/path_pattern.h"
#include "waypoint/core/route_handler.h"

#include <boost/asio/async_result.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

namespace waypoint::core {

// 404 "page not found", the result of a request no route matches.
HttpResponse not_found_response();

template<typename State>
struct Route {
    HttpMethod method;
    PathPattern pattern;
    RouteHandlerPtr<State> handler;
};

// Dispatches a request to the first route, in registration order, whose
// method and path pattern both match it. Every handler receives the same
// State instance.
//
// Routes must all be registered before the first call to run(); after
// that, run() may be called concurrently.
//
//   auto router = HttpRouter<AppState>::with_state(state)
//       .get(path("/hello"), get_hello)
//       .post(path("/users/:id"), update_user);
template<typename State>
class HttpRouter {
public:
    using StatePtr = std::shared_ptr<const State>;

    explicit HttpRouter(StatePtr state)
        : state_(std::move(state)) {}

    static HttpRouter with_state(StatePtr state) {
        return HttpRouter(std::move(state));
    }

    HttpRouter(HttpRouter&&) = default;
    HttpRouter& operator=(HttpRouter&&) = default;

    HttpRouter(const HttpRouter&) = delete;
    HttpRouter& operator=(const HttpRouter&) = delete;

    // Appends a route. Duplicates and shadowed routes are accepted; only
    // the earliest registered of them is ever reached.
    template<typename Handler>
    HttpRouter& add_route(HttpMethod method, PathPattern pattern, Handler&& handler) & {
        routes_.push_back(Route<State>{
            method,
            std::move(pattern),
            make_handler<State>(std::forward<Handler>(handler))});
        return *this;
    }

    template<typename Handler>
    HttpRouter&& add_route(HttpMethod method, PathPattern pattern, Handler&& handler) && {
        add_route(method, std::move(pattern), std::forward<Handler>(handler));
        return std::move(*this);
    }

    // One entry point per method, all delegating to add_route().
    template<typename Handler>
    HttpRouter& head(PathPattern pattern, Handler&& handler) & {
        return add_route(HttpMethod::Head, std::move(pattern), std::forward<Handler>(handler));
    }

    template<typename Handler>
    HttpRouter&& head(PathPattern pattern, Handler&& handler) && {
        return std::move(*this).add_route(
            HttpMethod::Head, std::move(pattern), std::forward<Handler>(handler));
    }

    template<typename Handler>
    HttpRouter& get(PathPattern pattern, Handler&& handler) & {
        return add_route(HttpMethod::Get, std::move(pattern), std::forward<Handler>(handler));
    }

    template<typename Handler>
    HttpRouter&& get(PathPattern pattern, Handler&& handler) && {
        return std::move(*this).add_route(
            HttpMethod::Get, std::move(pattern), std::forward<Handler>(handler));
    }

    template<typename Handler>
    HttpRouter& post(PathPattern pattern, Handler&& handler) & {
        return add_route(HttpMethod::Post, std::move(pattern), std::forward<Handler>(handler));
    }

    template<typename Handler>
    HttpRouter&& post(PathPattern pattern, Handler&& handler) && {
        return std::move(*this).add_route(
            HttpMethod::Post, std::move(pattern), std::forward<Handler>(handler));
    }

    template<typename Handler>
    HttpRouter& put(PathPattern pattern, Handler&& handler) & {
        return add_route(HttpMethod::Put, std::move(pattern), std::forward<Handler>(handler));
    }

    template<typename Handler>
    HttpRouter&& put(PathPattern pattern, Handler&& handler) && {
        return std::move(*this).add_route(
            HttpMethod::Put, std::move(pattern), std::forward<Handler>(handler));
    }

    template<typename Handler>
    HttpRouter& patch(PathPattern pattern, Handler&& handler) & {
        return add_route(HttpMethod::Patch, std::move(pattern), std::forward<Handler>(handler));
    }

    template<typename Handler>
    HttpRouter&& patch(PathPattern pattern, Handler&& handler) && {
        return std::move(*this).add_route(
            HttpMethod::Patch, std::move(pattern), std::forward<Handler>(handler));
    }

    template<typename Handler>
    HttpRouter& del(PathPattern pattern, Handler&& handler) & {
        return add_route(HttpMethod::Delete, std::move(pattern), std::forward<Handler>(handler));
    }

    template<typename Handler>
    HttpRouter&& del(PathPattern pattern, Handler&& handler) && {
        return std::move(*this).add_route(
            HttpMethod::Delete, std::move(pattern), std::forward<Handler>(handler));
    }

    template<typename Handler>
    HttpRouter& options(PathPattern pattern, Handler&& handler) & {
        return add_route(HttpMethod::Options, std::move(pattern), std::forward<Handler>(handler));
    }

    template<typename Handler>
    HttpRouter&& options(PathPattern pattern, Handler&& handler) && {
        return std::move(*this).add_route(
            HttpMethod::Options, std::move(pattern), std::forward<Handler>(handler));
    }

    template<typename Handler>
    HttpRouter& connect(PathPattern pattern, Handler&& handler) & {
        return add_route(HttpMethod::Connect, std::move(pattern), std::forward<Handler>(handler));
    }

    template<typename Handler>
    HttpRouter&& connect(PathPattern pattern, Handler&& handler) && {
        return std::move(*this).add_route(
            HttpMethod::Connect, std::move(pattern), std::forward<Handler>(handler));
    }

    template<typename Handler>
    HttpRouter& trace(PathPattern pattern, Handler&& handler) & {
        return add_route(HttpMethod::Trace, std::move(pattern), std::forward<Handler>(handler));
    }

    template<typename Handler>
    HttpRouter&& trace(PathPattern pattern, Handler&& handler) && {
        return std::move(*this).add_route(
            HttpMethod::Trace, std::move(pattern), std::forward<Handler>(handler));
    }

    // Completion signature: void(boost::system::error_code, HttpResponse).
    //
    // The error is errc::bad_request_target when the request target is not
    // a valid URL, otherwise whatever the matched handler failed with. A
    // request no route matches completes successfully with
    // not_found_response(). The completion runs in the context the
    // handler completes in.
    template<typename CompletionToken>
    auto run(HttpRequest request, CompletionToken&& token) const {
        return boost::asio::async_initiate<CompletionToken,
                                           void(boost::system::error_code, HttpResponse)>(
            [this](auto handler, HttpRequest req) {
                // ResponseCallback must be copyable; completion handlers
                // often are not.
                auto shared = std::make_shared<decltype(handler)>(std::move(handler));
                dispatch(std::move(req), [shared](boost::system::error_code ec, HttpResponse res) {
                    (*shared)(ec, std::move(res));
                });
            },
            token, std::move(request));
    }

    const StatePtr& state() const noexcept {
        return state_;
    }

    std::size_t size() const noexcept {
        return routes_.size();
    }

    bool empty() const noexcept {
        return routes_.empty();
    }

private:
    void dispatch(HttpRequest request, ResponseCallback done) const {
        boost::system::error_code ec;
        auto url = request.url(ec);
        if (ec) {
            done(ec, HttpResponse{});
            return;
        }

        for (const auto& route : routes_) {
            if (route.method != request.method()) {
                continue;
            }

            auto params = route.pattern.match(url.path());
            if (!params) {
                continue;
            }

            request.set_path_params(std::move(*params));
            route.handler->handle(std::move(request), state_, std::move(done));
            return;
        }

        done({}, not_found_response());
    }

    StatePtr state_;
    std::vector<Route<State>> routes_;
};

} // namespace waypoint::core
