#include "waypoint/core/url.h"
#include "waypoint/core/error.h"

#include <boost/url/encoding_opts.hpp>
#include <boost/url/params_view.hpp>
#include <boost/url/parse.hpp>
#include <boost/url/pct_string_view.hpp>
#include <boost/url/url.hpp>

namespace waypoint::core {

namespace urls = boost::urls;

namespace {

std::string to_string(urls::pct_string_view s) {
    return std::string(s.data(), s.size());
}

// Origin-form first; absolute-form must carry a host.
bool parse_target(std::string_view target, urls::url& out) {
    auto origin = urls::parse_origin_form(target);
    if (origin) {
        out = *origin;
        return true;
    }

    auto absolute = urls::parse_absolute_uri(target);
    if (!absolute || !absolute->has_authority() || absolute->encoded_host().empty()) {
        return false;
    }
    out = *absolute;
    if (out.encoded_path().empty()) {
        out.set_encoded_path("/");
    }
    return true;
}

} // namespace

const std::string& Url::path() const noexcept {
    return path_;
}

const std::string& Url::query() const noexcept {
    return query_;
}

const Url::QueryParams& Url::query_params() const noexcept {
    return query_params_;
}

std::string Url::query_param(std::string_view key) const {
    auto it = query_params_.find(std::string(key));
    return it != query_params_.end() ? it->second : std::string{};
}

std::optional<std::string> percent_decode(std::string_view encoded) {
    auto s = urls::make_pct_string_view(encoded);
    if (!s) {
        return std::nullopt;
    }
    return s->decode();
}

std::string encode_non_ascii(std::string_view s) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        auto u = static_cast<unsigned char>(c);
        if (u < 0x80) {
            out.push_back(c);
            continue;
        }
        out.push_back('%');
        out.push_back(kHex[u >> 4]);
        out.push_back(kHex[u & 0x0f]);
    }
    return out;
}

Url parse_url(std::string_view target, boost::system::error_code& ec) {
    ec = {};
    Url url;

    auto encoded = encode_non_ascii(target);
    urls::url parsed;
    if (!parse_target(encoded, parsed)) {
        ec = errc::bad_request_target;
        return url;
    }
    parsed.normalize_path();

    urls::encoding_opts opts;
    opts.space_as_plus = true;

    Url::QueryParams params;
    for (auto param : parsed.params(opts)) {
        // "a&&b" yields an empty param in between.
        if (param.key.empty() && !param.has_value) {
            continue;
        }
        // First occurrence wins for repeated keys.
        params.emplace(std::move(param.key), std::move(param.value));
    }

    url.path_ = to_string(parsed.encoded_path());
    url.query_ = to_string(parsed.encoded_query());
    url.query_params_ = std::move(params);
    return url;
}

Url parse_url(std::string_view target) {
    boost::system::error_code ec;
    auto url = parse_url(target, ec);
    if (ec) {
        throw UrlParseError("invalid request target: '" + std::string(target) + "'");
    }
    return url;
}

} // namespace waypoint::core
