#pragma once

#include <string>
#include <vector>

namespace logfanout {

enum class MatchType {
    EQUAL,
    NOT_EQUAL,
    REGEX,
    NOT_REGEX
};

[[nodiscard]] inline const char* match_type_to_string(MatchType t) {
    switch (t) {
        case MatchType::EQUAL:     return "=";
        case MatchType::NOT_EQUAL: return "!=";
        case MatchType::REGEX:     return "=~";
        case MatchType::NOT_REGEX: return "!~";
        default:                   return "=";
    }
}

// A parsed label matcher, produced by the query-language frontend
struct LabelMatcher {
    MatchType type = MatchType::EQUAL;
    std::string name;
    std::string value;

    /// Selector text, e.g. app="api" or level!~"debug|trace"
    [[nodiscard]] std::string to_string() const;
};

/// Matchers as a stream selector: {m1,m2,...}, "{}" when empty
[[nodiscard]] std::string matchers_to_string(const std::vector<LabelMatcher>& matchers);

} // namespace logfanout
