#include "RegexUtil.h"
#include <fmt/format.h>

RegexUtil::GroupedPatterns RegexUtil::GroupedPatterns::group(const MatchPredicateSet &predicate_set) {
    GroupedPatterns groups;

    for (auto &predicate : predicate_set) {
        if (predicate.is_term()) {
            groups.terms.emplace_back(predicate.term_text());
            continue;
        }

        NodeSpan nodes(predicate.get_pattern().nodes);

        // Empty patterns and lone wildcards are skipped.
        if (nodes.empty()) continue;

        auto &first = nodes.front();
        auto &last = nodes.back();

        if (auto literal = std::get_if<Literal>(&first)) {
            if (nodes.size() == 1) {
                groups.terms.emplace_back(literal->text);
            } else if (is_literal(last)) {
                groups.terms_internal_wc.push_back(nodes);
            } else {
                groups.terms_wc.push_back(nodes.first(nodes.size() - 1));
            }
        } else if (nodes.size() > 1) {
            if (is_literal(last)) {
                groups.wc_terms.push_back(nodes.subspan(1));
            } else {
                groups.wc_terms_wc.push_back(nodes.subspan(1, nodes.size() - 2));
            }
        }
    }

    return groups;
}

std::optional<std::string> RegexUtil::pattern_to_expr(NodeSpan nodes, std::string_view wildcard_expr,
                                                      const EscapeFunc &escape) {
    if (nodes.empty()) return std::nullopt;
    if (nodes.size() == 1 && is_wildcard(nodes.front())) return std::nullopt;

    std::string expr;
    for (auto &node : nodes) {
        if (auto literal = std::get_if<Literal>(&node)) {
            expr.append(escape(literal->text));
        } else {
            expr.append(wildcard_expr);
        }
    }
    return expr;
}

std::string RegexUtil::join_alternatives(const std::vector<std::optional<std::string>> &exprs) {
    std::vector<std::string> present;
    for (auto &expr : exprs) {
        if (expr && !expr->empty()) present.push_back(*expr);
    }

    if (present.empty()) return std::string(NEVER_MATCH_EXPR);
    return fmt::format("{}", fmt::join(present, "|"));
}
