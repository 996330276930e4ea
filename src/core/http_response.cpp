#include "waypoint/core/http_response.h"

namespace waypoint::core {

HttpResponse::HttpResponse()
    : status_(200) {}

HttpResponse HttpResponse::ok(std::string body) {
    HttpResponse res;
    res.set_text(std::move(body));
    return res;
}

HttpResponse HttpResponse::error(std::string message, int status) {
    HttpResponse res;
    res.set_status(status);
    res.set_text(std::move(message));
    return res;
}

int HttpResponse::status() const noexcept {
    return status_;
}

void HttpResponse::set_status(int status) {
    status_ = status;
}

const HttpResponse::Headers& HttpResponse::headers() const noexcept {
    return headers_;
}

std::string HttpResponse::header(const std::string& name) const {
    auto it = headers_.find(name);
    return it != headers_.end() ? it->second : std::string{};
}

void HttpResponse::set_header(std::string name, std::string value) {
    headers_[std::move(name)] = std::move(value);
}

const std::string& HttpResponse::body() const noexcept {
    return body_;
}

void HttpResponse::set_body(std::string body) {
    body_ = std::move(body);
}

void HttpResponse::set_json(std::string json_body) {
    set_header("Content-Type", "application/json");
    set_body(std::move(json_body));
}

void HttpResponse::set_text(std::string text_body) {
    set_header("Content-Type", "text/plain");
    set_body(std::move(text_body));
}

} // namespace waypoint::core
