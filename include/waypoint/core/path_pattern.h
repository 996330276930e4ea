#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace waypoint::core {

class PatternError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

using PathParams = std::unordered_map<std::string, std::string>;

// Compiled path template, e.g. "/users/:id" or "/static/*".
//
//   literal      matched verbatim, case-sensitive
//   :name        one or more characters up to the next '/'
//   :name?       optional; swallows the '/' right before it as well
//   *            any characters, '/' included; bound as "0", "1", ...
//   \c           the character c, literally
//
// Immutable once compiled; match() may be called concurrently.
class PathPattern {
public:
    // Throws PatternError on a malformed template.
    static PathPattern compile(std::string_view source);

    const std::string& source() const noexcept;

    // Names in order of appearance, wildcards included.
    std::vector<std::string> param_names() const;

    // The whole path has to match. Captured values are percent-decoded.
    std::optional<PathParams> match(std::string_view path) const;
    bool matches(std::string_view path) const;

private:
    struct Part {
        enum class Kind { Literal, Param, Wildcard };

        Kind kind;
        std::string text;   // literal text or the parameter name
        std::string prefix; // "/" for an optional param that owns its slash
        bool optional = false;
    };

    // Per-call scratch: the captures so far and the (part, pos) pairs
    // already known not to match, so each pair is explored once.
    struct MatchState;

    PathPattern() = default;

    bool run_match(std::string_view path, MatchState& state) const;
    bool match_from(std::size_t part, std::size_t pos, MatchState& state) const;

    std::string source_;
    std::vector<Part> parts_;
};

// Shorthand for PathPattern::compile.
PathPattern path(std::string_view source);

} // namespace waypoint::core
