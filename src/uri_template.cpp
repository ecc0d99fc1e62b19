#include "mcpgate/uri_template.hpp"
#include "mcpgate/error.hpp"
#include <algorithm>
#include <stdexcept>
#include <vector>

namespace mcpgate {

const std::string& UriParams::at(std::string_view name) const {
    for (const auto& [key, value] : values_) {
        if (key == name) return value;
    }
    throw std::out_of_range("No URI parameter named '" + std::string(name) + "'");
}

std::optional<std::string> UriParams::find(std::string_view name) const {
    for (const auto& [key, value] : values_) {
        if (key == name) return value;
    }
    return std::nullopt;
}

UriTemplate UriTemplate::compile(std::string pattern) {
    UriTemplate tmpl;
    std::string literal;

    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        if (c == '}') {
            throw McpError("Unbalanced '}' in URI template: " + pattern);
        }
        if (c != '{') {
            literal += c;
            continue;
        }

        size_t close = pattern.find_first_of("{}", i + 1);
        if (close == std::string::npos || pattern[close] != '}') {
            throw McpError("Unterminated placeholder in URI template: " + pattern);
        }
        std::string name = pattern.substr(i + 1, close - i - 1);
        if (name.empty()) {
            throw McpError("Empty placeholder name in URI template: " + pattern);
        }
        if (std::find(tmpl.names_.begin(), tmpl.names_.end(), name) != tmpl.names_.end()) {
            throw McpError("Duplicate placeholder '" + name + "' in URI template: " + pattern);
        }

        if (!literal.empty()) {
            tmpl.parts_.push_back({false, std::move(literal)});
            literal.clear();
        }
        tmpl.parts_.push_back({true, name});
        tmpl.names_.push_back(std::move(name));
        i = close;
    }
    if (!literal.empty()) {
        tmpl.parts_.push_back({false, std::move(literal)});
    }

    tmpl.pattern_ = std::move(pattern);
    return tmpl;
}

// viable[k][pos] records whether parts k.. match uri[pos..] exactly. Filling it
// back to front keeps matching linear in the URI length per part.
std::optional<UriParams> UriTemplate::match(std::string_view uri) const {
    const size_t n = uri.size();
    const size_t count = parts_.size();
    std::vector<std::vector<char>> viable(count + 1, std::vector<char>(n + 1, 0));
    viable[count][n] = 1;

    for (size_t k = count; k-- > 0;) {
        const Part& p = parts_[k];
        const auto& next = viable[k + 1];
        auto& cur = viable[k];
        if (!p.is_param) {
            const size_t len = p.text.size();
            for (size_t pos = 0; pos + len <= n; ++pos) {
                cur[pos] = next[pos + len] && uri.compare(pos, len, p.text) == 0;
            }
            continue;
        }
        size_t slash = n;                         // first '/' at or after pos
        size_t nearest = std::string_view::npos;  // first viable end after pos
        for (size_t pos = n; pos-- > 0;) {
            if (next[pos + 1]) nearest = pos + 1;
            if (uri[pos] == '/') slash = pos;
            cur[pos] = nearest != std::string_view::npos && nearest <= slash;
        }
    }
    if (!viable[0][0]) return std::nullopt;

    // Placeholders are greedy, so "{a}-{b}" splits "x-y-z" as a="x-y", b="z".
    UriParams params;
    size_t pos = 0;
    for (size_t k = 0; k < count; ++k) {
        const Part& p = parts_[k];
        if (!p.is_param) {
            pos += p.text.size();
            continue;
        }
        size_t end = uri.find('/', pos);
        if (end == std::string_view::npos) end = n;
        while (!viable[k + 1][end]) --end;
        params.push_back({p.text, std::string(uri.substr(pos, end - pos))});
        pos = end;
    }
    return params;
}

} // namespace mcpgate
