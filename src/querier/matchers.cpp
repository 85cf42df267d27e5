#include "querier/matchers.hpp"

#include <format>

namespace logfanout {

namespace {

// Double-quoted value with quotes, backslashes and control characters escaped
std::string quote(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    out += '"';
    for (const char c : value) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:   out += c;
        }
    }
    out += '"';
    return out;
}

} // anonymous namespace

std::string LabelMatcher::to_string() const {
    return std::format("{}{}{}", name, match_type_to_string(type), quote(value));
}

std::string matchers_to_string(const std::vector<LabelMatcher>& matchers) {
    std::string out = "{";
    for (size_t i = 0; i < matchers.size(); ++i) {
        if (i > 0) out += ',';
        out += matchers[i].to_string();
    }
    out += '}';
    return out;
}

} // namespace logfanout
