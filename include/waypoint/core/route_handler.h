#pragma once

#include "waypoint/core/http_request.h"
#include "waypoint/core/http_response.h"

#include <boost/system/error_code.hpp>

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace waypoint::core {

// Completes a request exactly once: a response with `ec` clear, or a failure.
using ResponseCallback = std::function<void(boost::system::error_code, HttpResponse)>;

template<typename State>
class RouteHandler {
public:
    using StatePtr = std::shared_ptr<const State>;

    virtual ~RouteHandler() = default;

    // May complete `done` before returning or later, from any thread.
    virtual void handle(HttpRequest request, StatePtr state, ResponseCallback done) const = 0;
};

template<typename State, typename Fn>
class FunctionHandler final : public RouteHandler<State> {
public:
    explicit FunctionHandler(Fn fn)
        : fn_(std::move(fn)) {}

    void handle(HttpRequest request,
                typename RouteHandler<State>::StatePtr state,
                ResponseCallback done) const override {
        fn_(std::move(request), std::move(state), std::move(done));
    }

private:
    Fn fn_;
};

template<typename State>
using RouteHandlerPtr = std::unique_ptr<RouteHandler<State>>;

// Accepts a RouteHandlerPtr as is, or wraps a callable
// void(HttpRequest, std::shared_ptr<const State>, ResponseCallback).
template<typename State, typename Fn>
RouteHandlerPtr<State> make_handler(Fn&& fn) {
    using F = std::decay_t<Fn>;
    if constexpr (std::is_convertible_v<F, RouteHandlerPtr<State>>) {
        return RouteHandlerPtr<State>(std::forward<Fn>(fn));
    } else {
        static_assert(
            std::is_invocable_v<const F&, HttpRequest, std::shared_ptr<const State>, ResponseCallback>,
            "handler must be callable as (HttpRequest, std::shared_ptr<const State>, ResponseCallback) const");
        return std::make_unique<FunctionHandler<State, F>>(std::forward<Fn>(fn));
    }
}

} // namespace waypoint::core
