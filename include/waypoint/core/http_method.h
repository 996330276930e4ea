#pragma once

#include <optional>
#include <string_view>

namespace waypoint::core {

enum class HttpMethod {
    Head,
    Get,
    Post,
    Put,
    Patch,
    Delete,
    Options,
    Connect,
    Trace
};

// Canonical upper-case token, e.g. "GET".
std::string_view to_string(HttpMethod method) noexcept;

// Method tokens are case-sensitive: "get" is not GET.
std::optional<HttpMethod> parse_method(std::string_view token) noexcept;

} // namespace waypoint::core
