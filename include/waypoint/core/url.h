#pragma once

#include <boost/system/error_code.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>

namespace waypoint::core {

class UrlParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Parsed request target. The path is normalized (dot segments removed,
// escapes upper-cased) but keeps its percent-encoding so that an encoded
// '/' inside a segment never splits it; query params are decoded.
class Url {
public:
    using QueryParams = std::unordered_map<std::string, std::string>;

    Url() = default;

    const std::string& path() const noexcept;
    const std::string& query() const noexcept;

    const QueryParams& query_params() const noexcept;
    std::string query_param(std::string_view key) const;

private:
    friend Url parse_url(std::string_view target, boost::system::error_code& ec);

    std::string path_;
    std::string query_;
    QueryParams query_params_;
};

// Accepts origin-form ("/a/b?x=1") and absolute-form ("http://host/a/b")
// request targets. Raw bytes >= 0x80 are percent-encoded before parsing.
Url parse_url(std::string_view target);
Url parse_url(std::string_view target, boost::system::error_code& ec);

// nullopt on a truncated or non-hex escape.
std::optional<std::string> percent_decode(std::string_view encoded);

// Escapes every byte >= 0x80 as %XX, leaving everything else untouched.
std::string encode_non_ascii(std::string_view s);

} // namespace waypoint::core
