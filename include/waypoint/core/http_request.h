#pragma once

#include "waypoint/core/http_method.h"
#include "waypoint/core/path_pattern.h"
#include "waypoint/core/url.h"

#include <boost/system/error_code.hpp>

#include <string>
#include <string_view>
#include <unordered_map>

namespace waypoint::core {

class HttpRequest {
public:
    using Headers = std::unordered_map<std::string, std::string>;

    HttpRequest() = default;
    HttpRequest(HttpMethod method, std::string target);

    // --- method / target ---
    HttpMethod method() const noexcept;
    const std::string& target() const noexcept;

    void set_method(HttpMethod method);
    void set_target(std::string target);

    // Throws UrlParseError when the target is not a valid URL.
    Url url() const;
    Url url(boost::system::error_code& ec) const;

    // --- headers ---
    // Names are compared case-insensitively.
    const Headers& headers() const noexcept;
    bool has_header(std::string_view name) const;
    std::string header(std::string_view name) const;

    void set_header(std::string name, std::string value);

    // --- path params, bound by the router on a match ---
    const PathParams& path_params() const noexcept;
    std::string path_param(std::string_view name) const;
    void set_path_params(PathParams params);

    // --- body ---
    const std::string& body() const noexcept;
    void set_body(std::string body);

private:
    HttpMethod method_ = HttpMethod::Get;
    std::string target_ = "/";
    Headers headers_;
    PathParams path_params_;
    std::string body_;
};

} // namespace waypoint::core
