#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mcpgate {

/// Placeholder values captured by a template match, in declaration order.
class UriParams {
public:
    using value_type = std::pair<std::string, std::string>;
    using const_iterator = std::vector<value_type>::const_iterator;

    UriParams() = default;
    UriParams(std::initializer_list<value_type> init) : values_(init) {}

    void push_back(value_type v) { values_.push_back(std::move(v)); }

    /// Throws std::out_of_range if `name` was not captured.
    [[nodiscard]] const std::string& at(std::string_view name) const;
    [[nodiscard]] std::optional<std::string> find(std::string_view name) const;

    [[nodiscard]] size_t size() const { return values_.size(); }
    [[nodiscard]] bool empty() const { return values_.empty(); }
    const_iterator begin() const { return values_.begin(); }
    const_iterator end() const { return values_.end(); }

    bool operator==(const UriParams& o) const { return values_ == o.values_; }

private:
    std::vector<value_type> values_;
};

/// Compiled "{name}" URI pattern. Each placeholder matches one non-empty
/// segment without '/'; everything else is literal. Matching is anchored at
/// both ends.
class UriTemplate {
public:
    /// Throws McpError on unbalanced braces, empty or duplicate names.
    [[nodiscard]] static UriTemplate compile(std::string pattern);

    [[nodiscard]] std::optional<UriParams> match(std::string_view uri) const;

    [[nodiscard]] const std::string& pattern() const { return pattern_; }
    [[nodiscard]] const std::vector<std::string>& param_names() const { return names_; }

private:
    struct Part {
        bool is_param;
        std::string text;  // literal text, or the placeholder name
    };

    UriTemplate() = default;

    std::string pattern_;
    std::vector<Part> parts_;
    std::vector<std::string> names_;
};

} // namespace mcpgate
