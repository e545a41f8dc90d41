#ifndef TOKENMATCHER_REGEXUTIL_H
#define TOKENMATCHER_REGEXUTIL_H

#include <string>
#include <string_view>
#include <vector>
#include <span>
#include <optional>
#include <functional>
#include "Pattern.h"

namespace RegexUtil {
    using NodeSpan = std::span<const PatternNode>;

    // Turns a literal into something the target regex syntax matches verbatim.
    using EscapeFunc = std::function<std::string(std::string_view)>;

    // An empty character class. Used in place of an empty expression, which would match every token.
    constexpr inline std::string_view NEVER_MATCH_EXPR = "[^\\x00-\\x{10ffff}]";

    /**
     * Patterns grouped into 5 groups by where their wildcards are:
     *  1. terms: no wildcards
     *  2. terms_wc: ends with a wildcard, but does not start with one ("lit*")
     *  3. terms_internal_wc: neither starts nor ends with a wildcard, but has internal wildcards ("lit*lit")
     *  4. wc_terms: starts with a wildcard, but does not end with one ("*lit")
     *  5. wc_terms_wc: starts and ends with a wildcard ("*lit*")
     *
     * The wildcards at the start/end are stripped away. Grouping lets the automaton share one wildcard between many
     * alternatives, e.g. ".*(foo|bar)" instead of "(.*foo)|(.*bar)", which compiles much faster.
     *
     * Everything here points into the predicate set the groups were made from.
     */
    struct GroupedPatterns {
        std::vector<std::string_view> terms;
        std::vector<NodeSpan> terms_wc;
        std::vector<NodeSpan> terms_internal_wc;
        std::vector<NodeSpan> wc_terms;
        std::vector<NodeSpan> wc_terms_wc;

        static GroupedPatterns group(const MatchPredicateSet &predicate_set);

        std::size_t size() const {
            return terms.size() + terms_wc.size() + terms_internal_wc.size() + wc_terms.size() + wc_terms_wc.size();
        }
    };

    // Concatenates nodes, escaping literals and replacing each wildcard with wildcard_expr.
    // Nothing for an empty run or a lone wildcard.
    std::optional<std::string> pattern_to_expr(NodeSpan nodes, std::string_view wildcard_expr,
                                               const EscapeFunc &escape);

    // Joins the non-empty group expressions with '|'. NEVER_MATCH_EXPR if all are empty.
    std::string join_alternatives(const std::vector<std::optional<std::string>> &exprs);
}

#endif //TOKENMATCHER_REGEXUTIL_H
