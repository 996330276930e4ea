#include "waypoint/core/http_request.h"

#include <algorithm>
#include <cctype>

namespace waypoint::core {

namespace {

std::string lowercase(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

} // namespace

HttpRequest::HttpRequest(HttpMethod method, std::string target)
    : method_(method)
    , target_(std::move(target)) {}

HttpMethod HttpRequest::method() const noexcept {
    return method_;
}

const std::string& HttpRequest::target() const noexcept {
    return target_;
}

void HttpRequest::set_method(HttpMethod method) {
    method_ = method;
}

void HttpRequest::set_target(std::string target) {
    target_ = std::move(target);
}

Url HttpRequest::url() const {
    return parse_url(target_);
}

Url HttpRequest::url(boost::system::error_code& ec) const {
    return parse_url(target_, ec);
}

const HttpRequest::Headers& HttpRequest::headers() const noexcept {
    return headers_;
}

bool HttpRequest::has_header(std::string_view name) const {
    return headers_.find(lowercase(name)) != headers_.end();
}

std::string HttpRequest::header(std::string_view name) const {
    auto it = headers_.find(lowercase(name));
    return it != headers_.end() ? it->second : std::string{};
}

void HttpRequest::set_header(std::string name, std::string value) {
    headers_[lowercase(name)] = std::move(value);
}

const PathParams& HttpRequest::path_params() const noexcept {
    return path_params_;
}

std::string HttpRequest::path_param(std::string_view name) const {
    auto it = path_params_.find(std::string(name));
    return it != path_params_.end() ? it->second : std::string{};
}

void HttpRequest::set_path_params(PathParams params) {
    path_params_ = std::move(params);
}

const std::string& HttpRequest::body() const noexcept {
    return body_;
}

void HttpRequest::set_body(std::string body) {
    body_ = std::move(body);
}

} // namespace waypoint::core
