#pragma once

#include <cstdint>
#include <memory>
#include <regex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/proxy_errors.hpp"

namespace mcproxy::registry {

// A compiled discovery path. Accepted grammar (everything else is a
// QuerySyntax error):
//
//   path     := '$' step*
//   step     := '.' name | '.*' | '[' selector ']'
//   selector := '*' | int | quoted | '?(' filter ')'
//   filter   := '@' ('.' name)* [ op literal ]
//   op       := '==' | '!=' | '<' | '<=' | '>' | '>=' | '=~'
//   literal  := quoted | number | true | false | null | '/' regex '/' ['i']
//
// Examples: $.tools[*].name, $.tools[?(@.server=='fs')],
//           $.tools[?(@.name =~ /^git::/i)].description
class PathQuery {
public:
    static core::errors::Result<PathQuery> parse(const std::string& expression);

    // All matches in document order; an empty array when nothing matches.
    nlohmann::json evaluate(const nlohmann::json& root) const;

    const std::string& expression() const { return expression_; }

    enum class StepKind { Field, Wildcard, Index, Filter };
    enum class Op { Exists, Eq, Ne, Lt, Le, Gt, Ge, Match };

    struct Filter {
        std::vector<std::string> path;
        Op op = Op::Exists;
        nlohmann::json literal;
        std::shared_ptr<const std::regex> pattern;
    };

    struct Step {
        StepKind kind = StepKind::Field;
        std::string field;
        std::int64_t index = 0;
        Filter filter;
    };

private:
    static bool matches(const Filter& filter, const nlohmann::json& candidate);

    std::string expression_;
    std::vector<Step> steps_;
};

}  // namespace mcproxy::registry
