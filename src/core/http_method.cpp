#include "waypoint/core/http_method.h"

#include <array>
#include <utility>

namespace waypoint::core {

namespace {

constexpr std::array<std::pair<HttpMethod, std::string_view>, 9> kMethods{{
    {HttpMethod::Head, "HEAD"},
    {HttpMethod::Get, "GET"},
    {HttpMethod::Post, "POST"},
    {HttpMethod::Put, "PUT"},
    {HttpMethod::Patch, "PATCH"},
    {HttpMethod::Delete, "DELETE"},
    {HttpMethod::Options, "OPTIONS"},
    {HttpMethod::Connect, "CONNECT"},
    {HttpMethod::Trace, "TRACE"},
}};

} // namespace

std::string_view to_string(HttpMethod method) noexcept {
    for (const auto& [value, name] : kMethods) {
        if (value == method) {
            return name;
        }
    }
    return {};
}

std::optional<HttpMethod> parse_method(std::string_view token) noexcept {
    for (const auto& [value, name] : kMethods) {
        if (name == token) {
            return value;
        }
    }
    return std::nullopt;
}

} // namespace waypoint::core
