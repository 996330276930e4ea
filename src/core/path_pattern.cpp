#include "waypoint/core/path_pattern.h"
#include "waypoint/core/url.h"

namespace waypoint::core {

namespace {

bool is_name_start(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool is_name_char(char c) noexcept {
    return is_name_start(c) || (c >= '0' && c <= '9');
}

[[noreturn]] void fail(std::string_view source, const std::string& what) {
    throw PatternError("failed to parse route pattern: " + what +
                       " in '" + std::string(source) + "'");
}

// Request paths arrive percent-encoded, so literals are compared in that form.
void append_literal(std::string& out, char c) {
    out += encode_non_ascii(std::string_view(&c, 1));
}

std::string decode_or_raw(std::string_view value) {
    auto decoded = percent_decode(value);
    return decoded ? std::move(*decoded) : std::string(value);
}

} // namespace

PathPattern PathPattern::compile(std::string_view source) {
    if (source.empty()) {
        fail(source, "empty pattern");
    }
    if (source.front() != '/' && source.front() != '*') {
        fail(source, "pattern must start with '/' or '*'");
    }

    PathPattern pattern;
    pattern.source_ = std::string(source);
    auto& parts = pattern.parts_;
    std::size_t wildcards = 0;

    auto literal = [&parts]() -> std::string& {
        if (parts.empty() || parts.back().kind != Part::Kind::Literal) {
            parts.push_back(Part{Part::Kind::Literal, {}, {}, false});
        }
        return parts.back().text;
    };

    auto add_variable = [&](Part part) {
        bool separated = !part.prefix.empty() ||
                         parts.empty() ||
                         parts.back().kind == Part::Kind::Literal;
        if (!separated) {
            fail(source, "adjacent parameters need a literal between them");
        }
        parts.push_back(std::move(part));
    };

    std::size_t i = 0;
    while (i < source.size()) {
        char c = source[i];
        auto u = static_cast<unsigned char>(c);

        if (u <= 0x20 || u == 0x7f) {
            fail(source, "whitespace or control character at offset " + std::to_string(i));
        }

        switch (c) {
        case '\\':
            if (i + 1 == source.size()) {
                fail(source, "trailing escape character");
            }
            append_literal(literal(), source[i + 1]);
            i += 2;
            break;

        case ':': {
            std::size_t name_end = i + 1;
            if (name_end == source.size() || !is_name_start(source[name_end])) {
                fail(source, "missing parameter name at offset " + std::to_string(i));
            }
            while (name_end < source.size() && is_name_char(source[name_end])) {
                ++name_end;
            }

            Part part{Part::Kind::Param, std::string(source.substr(i + 1, name_end - i - 1)), {}, false};
            i = name_end;

            if (i < source.size() && source[i] == '?') {
                part.optional = true;
                ++i;
                if (!parts.empty() && parts.back().kind == Part::Kind::Literal &&
                    !parts.back().text.empty() && parts.back().text.back() == '/') {
                    parts.back().text.pop_back();
                    if (parts.back().text.empty()) {
                        parts.pop_back();
                    }
                    part.prefix = "/";
                }
            } else if (i < source.size() && (source[i] == '+' || source[i] == '*')) {
                fail(source, std::string("unsupported modifier '") + source[i] + "'");
            }

            add_variable(std::move(part));
            break;
        }

        case '*':
            add_variable(Part{Part::Kind::Wildcard, std::to_string(wildcards++), {}, false});
            ++i;
            break;

        case '(':
        case ')':
        case '{':
        case '}':
            fail(source, std::string("unsupported group syntax '") + c + "'");
            break;

        case '?':
            fail(source, "unexpected '?' at offset " + std::to_string(i));
            break;

        default:
            append_literal(literal(), c);
            ++i;
            break;
        }
    }

    return pattern;
}

const std::string& PathPattern::source() const noexcept {
    return source_;
}

std::vector<std::string> PathPattern::param_names() const {
    std::vector<std::string> names;
    for (const auto& part : parts_) {
        if (part.kind != Part::Kind::Literal) {
            names.push_back(part.text);
        }
    }
    return names;
}

struct PathPattern::MatchState {
    std::string_view path;
    std::vector<std::pair<std::string_view, std::string_view>> captures;
    std::vector<char> failed;
};

std::optional<PathParams> PathPattern::match(std::string_view path) const {
    MatchState state;
    if (!run_match(path, state)) {
        return std::nullopt;
    }

    PathParams params;
    for (const auto& [name, value] : state.captures) {
        // A repeated name keeps its last binding.
        params[std::string(name)] = decode_or_raw(value);
    }
    return params;
}

bool PathPattern::matches(std::string_view path) const {
    MatchState state;
    return run_match(path, state);
}

bool PathPattern::run_match(std::string_view path, MatchState& state) const {
    state.path = path;
    state.failed.assign(parts_.size() * (path.size() + 1), 0);
    return match_from(0, 0, state);
}

bool PathPattern::match_from(std::size_t part, std::size_t pos, MatchState& state) const {
    const auto path = state.path;
    if (part == parts_.size()) {
        return pos == path.size();
    }

    auto& failed = state.failed[part * (path.size() + 1) + pos];
    if (failed) {
        return false;
    }

    auto& captures = state.captures;
    const auto& p = parts_[part];
    auto rest = path.substr(pos);

    switch (p.kind) {
    case Part::Kind::Literal:
        if (rest.compare(0, p.text.size(), p.text) == 0 &&
            match_from(part + 1, pos + p.text.size(), state)) {
            return true;
        }
        break;

    case Part::Kind::Param:
        if (rest.compare(0, p.prefix.size(), p.prefix) == 0) {
            auto start = pos + p.prefix.size();
            auto segment_end = path.find('/', start);
            if (segment_end == std::string_view::npos) {
                segment_end = path.size();
            }
            // Shortest capture first.
            for (auto end = start + 1; end <= segment_end; ++end) {
                captures.emplace_back(p.text, path.substr(start, end - start));
                if (match_from(part + 1, end, state)) {
                    return true;
                }
                captures.pop_back();
            }
        }
        if (p.optional && match_from(part + 1, pos, state)) {
            return true;
        }
        break;

    case Part::Kind::Wildcard:
        // Longest capture first.
        for (auto end = path.size() + 1; end-- > pos;) {
            captures.emplace_back(p.text, path.substr(pos, end - pos));
            if (match_from(part + 1, end, state)) {
                return true;
            }
            captures.pop_back();
        }
        break;
    }

    failed = 1;
    return false;
}

PathPattern path(std::string_view source) {
    return PathPattern::compile(source);
}

} // namespace waypoint::core
