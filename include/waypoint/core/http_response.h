#pragma once

#include <string>
#include <unordered_map>

namespace waypoint::core {

class HttpResponse {
public:
    using Headers = std::unordered_map<std::string, std::string>;

    HttpResponse();

    // 200 with a text/plain body.
    static HttpResponse ok(std::string body);

    // `status` with `message` as the text/plain body.
    static HttpResponse error(std::string message, int status);

    // --- status ---
    int status() const noexcept;
    void set_status(int status);

    // --- headers ---
    const Headers& headers() const noexcept;
    std::string header(const std::string& name) const;
    void set_header(std::string name, std::string value);

    // --- body ---
    const std::string& body() const noexcept;
    void set_body(std::string body);

    // --- helpers ---
    void set_json(std::string json_body);
    void set_text(std::string text_body);

private:
    int status_;
    Headers headers_;
    std::string body_;
};

} // namespace waypoint::core
