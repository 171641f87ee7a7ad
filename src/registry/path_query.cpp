#include "registry/path_query.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <optional>
#include <utility>

namespace mcproxy::registry {

using core::errors::ErrorCategory;
using core::errors::ProxyError;
using nlohmann::json;

namespace {

class Parser {
public:
    explicit Parser(const std::string& text) : text_(text) {}

    core::errors::Result<std::vector<PathQuery::Step>> run() {
        std::vector<PathQuery::Step> steps;
        skip_spaces();
        if (!consume('$')) {
            return fail("path must start with '$'");
        }

        while (true) {
            skip_spaces();
            if (at_end()) {
                break;
            }
            PathQuery::Step step;
            const char c = text_[pos_];
            if (c == '.') {
                ++pos_;
                if (peek('.')) {
                    return fail("recursive descent '..' is not supported");
                }
                if (consume('*')) {
                    step.kind = PathQuery::StepKind::Wildcard;
                } else {
                    auto name = parse_name();
                    if (!name) {
                        return fail("expected a field name after '.'");
                    }
                    step.kind = PathQuery::StepKind::Field;
                    step.field = *name;
                }
            } else if (c == '[') {
                ++pos_;
                skip_spaces();
                if (!parse_selector(step)) {
                    return *error_;
                }
                skip_spaces();
                if (!consume(']')) {
                    return fail("expected ']'");
                }
            } else {
                return fail(std::string("unexpected character '") + c + "'");
            }
            steps.push_back(std::move(step));
        }
        return steps;
    }

private:
    bool at_end() const { return pos_ >= text_.size(); }
    bool peek(const char c) const { return !at_end() && text_[pos_] == c; }

    bool consume(const char c) {
        if (peek(c)) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool consume(const std::string& token) {
        if (text_.compare(pos_, token.size(), token) == 0) {
            pos_ += token.size();
            return true;
        }
        return false;
    }

    void skip_spaces() {
        while (!at_end() && std::isspace(static_cast<unsigned char>(text_[pos_])) != 0) {
            ++pos_;
        }
    }

    ProxyError fail(const std::string& reason) {
        ProxyError err{ErrorCategory::QuerySyntax,
                       "Invalid discovery path at position " + std::to_string(pos_) +
                           ": " + reason,
                       "invalid_jsonpath",
                       "Supported: $.field, [*], [n], ['field'], [?(@.field == 'x')], "
                       "[?(@.field =~ /regex/i)]"};
        error_ = err;
        return err;
    }

    std::optional<std::string> parse_name() {
        const std::size_t start = pos_;
        while (!at_end()) {
            const unsigned char c = static_cast<unsigned char>(text_[pos_]);
            const bool first = pos_ == start;
            if (std::isalpha(c) != 0 || c == '_' || (!first && (std::isdigit(c) != 0 || c == '-'))) {
                ++pos_;
                continue;
            }
            break;
        }
        if (pos_ == start) {
            return std::nullopt;
        }
        return text_.substr(start, pos_ - start);
    }

    std::optional<std::string> parse_quoted() {
        if (!peek('\'') && !peek('"')) {
            return std::nullopt;
        }
        const char quote = text_[pos_++];
        std::string value;
        while (!at_end()) {
            const char c = text_[pos_++];
            if (c == '\\' && !at_end()) {
                value.push_back(text_[pos_++]);
                continue;
            }
            if (c == quote) {
                return value;
            }
            value.push_back(c);
        }
        fail("unterminated string literal");
        return std::nullopt;
    }

    std::optional<json> parse_number() {
        const std::size_t start = pos_;
        if (peek('-') || peek('+')) {
            ++pos_;
        }
        bool is_integer = true;
        while (!at_end()) {
            const char c = text_[pos_];
            if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
                ++pos_;
            } else if (c == '.' || c == 'e' || c == 'E' ||
                       ((c == '-' || c == '+') && (text_[pos_ - 1] == 'e' || text_[pos_ - 1] == 'E'))) {
                is_integer = false;
                ++pos_;
            } else {
                break;
            }
        }
        const std::string token = text_.substr(start, pos_ - start);
        if (token.empty() || token == "-" || token == "+") {
            pos_ = start;
            return std::nullopt;
        }

        char* end = nullptr;
        errno = 0;
        if (is_integer) {
            const long long value = std::strtoll(token.c_str(), &end, 10);
            if (errno == 0 && end != nullptr && *end == '\0') {
                return json(static_cast<std::int64_t>(value));
            }
        } else {
            const double value = std::strtod(token.c_str(), &end);
            if (errno == 0 && end != nullptr && *end == '\0') {
                return json(value);
            }
        }
        pos_ = start;
        return std::nullopt;
    }

    bool parse_selector(PathQuery::Step& step) {
        if (consume('*')) {
            step.kind = PathQuery::StepKind::Wildcard;
            return true;
        }
        if (peek('\'') || peek('"')) {
            auto name = parse_quoted();
            if (!name) {
                return false;
            }
            step.kind = PathQuery::StepKind::Field;
            step.field = *name;
            return true;
        }
        if (consume('?')) {
            skip_spaces();
            if (!consume('(')) {
                fail("expected '(' after '?'");
                return false;
            }
            step.kind = PathQuery::StepKind::Filter;
            if (!parse_filter(step.filter)) {
                return false;
            }
            skip_spaces();
            if (!consume(')')) {
                fail("expected ')' to close the filter");
                return false;
            }
            return true;
        }

        const std::size_t start = pos_;
        auto number = parse_number();
        if (number && number->is_number_integer()) {
            step.kind = PathQuery::StepKind::Index;
            step.index = number->get<std::int64_t>();
            return true;
        }
        pos_ = start;
        fail("expected '*', an index, a quoted field or a filter; slices and unions are not supported");
        return false;
    }

    bool parse_regex(PathQuery::Filter& filter) {
        std::string pattern;
        bool icase = false;
        if (consume('/')) {
            bool closed = false;
            while (!at_end()) {
                const char c = text_[pos_++];
                if (c == '\\' && peek('/')) {
                    pattern.push_back('/');
                    ++pos_;
                    continue;
                }
                if (c == '/') {
                    closed = true;
                    break;
                }
                pattern.push_back(c);
            }
            if (!closed) {
                fail("unterminated regular expression");
                return false;
            }
            while (!at_end() && std::isalpha(static_cast<unsigned char>(text_[pos_])) != 0) {
                if (text_[pos_] != 'i') {
                    fail(std::string("unsupported regex flag '") + text_[pos_] + "'");
                    return false;
                }
                icase = true;
                ++pos_;
            }
        } else {
            auto quoted = parse_quoted();
            if (!quoted) {
                if (!error_) {
                    fail("expected /regex/ or a quoted pattern after '=~'");
                }
                return false;
            }
            pattern = *quoted;
        }

        auto flags = std::regex::ECMAScript;
        if (icase) {
            flags |= std::regex::icase;
        }
        try {
            filter.pattern = std::make_shared<const std::regex>(pattern, flags);
        } catch (const std::regex_error& e) {
            fail("invalid regular expression '" + pattern + "': " + e.what());
            return false;
        }
        filter.literal = pattern;
        return true;
    }

    bool parse_filter(PathQuery::Filter& filter) {
        skip_spaces();
        if (!consume('@')) {
            fail("filter must start with '@'");
            return false;
        }
        while (consume('.')) {
            auto name = parse_name();
            if (!name) {
                fail("expected a field name in filter");
                return false;
            }
            filter.path.push_back(*name);
        }
        skip_spaces();
        if (peek(')')) {
            filter.op = PathQuery::Op::Exists;
            return true;
        }

        if (consume("==")) {
            filter.op = PathQuery::Op::Eq;
        } else if (consume("!=")) {
            filter.op = PathQuery::Op::Ne;
        } else if (consume("=~")) {
            filter.op = PathQuery::Op::Match;
        } else if (consume("<=")) {
            filter.op = PathQuery::Op::Le;
        } else if (consume(">=")) {
            filter.op = PathQuery::Op::Ge;
        } else if (consume('<')) {
            filter.op = PathQuery::Op::Lt;
        } else if (consume('>')) {
            filter.op = PathQuery::Op::Gt;
        } else {
            fail("expected a comparison operator");
            return false;
        }
        skip_spaces();

        if (filter.op == PathQuery::Op::Match) {
            return parse_regex(filter);
        }
        return parse_literal(filter.literal);
    }

    bool parse_literal(json& literal) {
        if (peek('\'') || peek('"')) {
            auto quoted = parse_quoted();
            if (!quoted) {
                return false;
            }
            literal = *quoted;
            return true;
        }
        if (consume("true")) {
            literal = true;
            return true;
        }
        if (consume("false")) {
            literal = false;
            return true;
        }
        if (consume("null")) {
            literal = nullptr;
            return true;
        }
        auto number = parse_number();
        if (number) {
            literal = *number;
            return true;
        }
        fail("expected a literal (string, number, true, false or null)");
        return false;
    }

    const std::string& text_;
    std::size_t pos_ = 0;
    std::optional<ProxyError> error_;
};

const json* resolve_path(const json& start, const std::vector<std::string>& path) {
    const json* node = &start;
    for (const auto& name : path) {
        if (!node->is_object()) {
            return nullptr;
        }
        const auto it = node->find(name);
        if (it == node->end()) {
            return nullptr;
        }
        node = &(*it);
    }
    return node;
}

}  // namespace

core::errors::Result<PathQuery> PathQuery::parse(const std::string& expression) {
    Parser parser(expression);
    auto steps = parser.run();
    if (core::errors::is_error(steps)) {
        return core::errors::get_error(steps);
    }
    PathQuery query;
    query.expression_ = expression;
    query.steps_ = std::move(core::errors::get_value(steps));
    return query;
}

bool PathQuery::matches(const Filter& filter, const json& candidate) {
    const json* value = resolve_path(candidate, filter.path);
    if (value == nullptr) {
        return false;
    }

    switch (filter.op) {
        case Op::Exists:
            return true;
        case Op::Eq:
            return *value == filter.literal;
        case Op::Ne:
            return *value != filter.literal;
        case Op::Match:
            return value->is_string() && filter.pattern &&
                   std::regex_search(value->get_ref<const std::string&>(), *filter.pattern);
        case Op::Lt:
        case Op::Le:
        case Op::Gt:
        case Op::Ge: {
            int order = 0;
            if (value->is_number() && filter.literal.is_number()) {
                const double lhs = value->get<double>();
                const double rhs = filter.literal.get<double>();
                order = lhs < rhs ? -1 : (lhs > rhs ? 1 : 0);
            } else if (value->is_string() && filter.literal.is_string()) {
                order = value->get_ref<const std::string&>().compare(
                    filter.literal.get_ref<const std::string&>());
            } else {
                return false;
            }
            if (filter.op == Op::Lt) return order < 0;
            if (filter.op == Op::Le) return order <= 0;
            if (filter.op == Op::Gt) return order > 0;
            return order >= 0;
        }
        default:
            return false;
    }
}

json PathQuery::evaluate(const json& root) const {
    std::vector<const json*> current{&root};

    for (const auto& step : steps_) {
        std::vector<const json*> next;
        for (const json* node : current) {
            switch (step.kind) {
                case StepKind::Field: {
                    if (!node->is_object()) {
                        break;
                    }
                    const auto it = node->find(step.field);
                    if (it != node->end()) {
                        next.push_back(&(*it));
                    }
                    break;
                }
                case StepKind::Wildcard:
                    if (node->is_object() || node->is_array()) {
                        for (const auto& child : *node) {
                            next.push_back(&child);
                        }
                    }
                    break;
                case StepKind::Index: {
                    if (!node->is_array()) {
                        break;
                    }
                    const auto size = static_cast<std::int64_t>(node->size());
                    const std::int64_t index = step.index < 0 ? size + step.index : step.index;
                    if (index >= 0 && index < size) {
                        next.push_back(&(*node)[static_cast<std::size_t>(index)]);
                    }
                    break;
                }
                case StepKind::Filter:
                    if (node->is_object() || node->is_array()) {
                        for (const auto& child : *node) {
                            if (matches(step.filter, child)) {
                                next.push_back(&child);
                            }
                        }
                    }
                    break;
            }
        }
        current = std::move(next);
    }

    json results = json::array();
    for (const json* match : current) {
        results.push_back(*match);
    }
    return results;
}

}  // namespace mcproxy::registry
