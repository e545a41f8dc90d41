#include "Pattern.h"
#include <stdexcept>

Pattern Pattern::parse(std::string_view text) {
    std::vector<PatternNode> nodes;
    std::string literal;

    for (auto c : text) {
        if (c == '*') {
            if (!literal.empty()) {
                nodes.emplace_back(Literal{std::move(literal)});
                literal.clear();
            }
            // Two adjacent wildcards are equivalent to one.
            if (nodes.empty() || !is_wildcard(nodes.back())) {
                nodes.emplace_back(Wildcard{});
            }
        } else {
            literal.push_back(c);
        }
    }
    if (!literal.empty()) nodes.emplace_back(Literal{std::move(literal)});

    return Pattern(std::move(nodes));
}

std::string Pattern::as_string() const {
    std::string out;
    for (auto &node : nodes) {
        if (auto literal = std::get_if<Literal>(&node)) {
            out.append(literal->text);
        } else {
            out.push_back('*');
        }
    }
    return out;
}

MatchPredicate MatchPredicate::parse(std::string_view text) {
    if (text.empty()) {
        throw std::runtime_error("Empty match predicate");
    }

    if (text.find('*') == std::string_view::npos) {
        return MatchPredicate::term(std::string(text));
    }
    return MatchPredicate::pattern(Pattern::parse(text));
}

std::string MatchPredicate::as_string() const {
    if (is_term()) return term_text();
    return get_pattern().as_string();
}

MatchPredicateSet make_predicate_set(const std::vector<std::string> &patterns) {
    MatchPredicateSet set;
    for (auto &p : patterns) {
        set.insert(MatchPredicate::parse(p));
    }
    return set;
}

MatchPredicateSet make_predicate_set(std::initializer_list<std::string_view> patterns) {
    MatchPredicateSet set;
    for (auto p : patterns) {
        set.insert(MatchPredicate::parse(p));
    }
    return set;
}
