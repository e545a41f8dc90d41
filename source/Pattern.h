#ifndef TOKENMATCHER_PATTERN_H
#define TOKENMATCHER_PATTERN_H

#include <string>
#include <string_view>
#include <vector>
#include <variant>
#include <set>
#include <compare>
#include <initializer_list>

struct Literal {
    std::string text;

    auto operator<=>(const Literal &other) const = default;
};

// Zero or more characters from the configured wildcard code-point range.
struct Wildcard {
    auto operator<=>(const Wildcard &other) const = default;
};

/**
 * One segment of a wildcard pattern. Literal sorts before Wildcard.
 */
using PatternNode = std::variant<Literal, Wildcard>;

inline bool is_wildcard(const PatternNode &node) {
    return std::holds_alternative<Wildcard>(node);
}

inline bool is_literal(const PatternNode &node) {
    return std::holds_alternative<Literal>(node);
}

struct Pattern {
    std::vector<PatternNode> nodes;

    Pattern() = default;

    explicit Pattern(std::vector<PatternNode> nodes) : nodes(std::move(nodes)) {};

    // "f*r" -> [f, *, r]. Runs of '*' collapse into one wildcard.
    static Pattern parse(std::string_view text);

    std::string as_string() const;

    std::size_t size() const { return nodes.size(); }

    bool empty() const { return nodes.empty(); }

    auto operator<=>(const Pattern &other) const = default;

    bool operator==(const Pattern &other) const = default;
};

/**
 * All things a token matcher can match for: an exact term, or a wildcard pattern.
 * Every term sorts before every pattern. The ordering decides the position of each plain term in the compiled
 * regex's capture groups, so it must stay deterministic.
 */
struct MatchPredicate {
    struct TermText {
        std::string text;

        auto operator<=>(const TermText &other) const = default;
    };

    std::variant<TermText, Pattern> value;

    static MatchPredicate term(std::string text) {
        return MatchPredicate{TermText{std::move(text)}};
    }

    static MatchPredicate pattern(Pattern pattern) {
        return MatchPredicate{std::move(pattern)};
    }

    // A string without '*' becomes a term, anything else a pattern.
    static MatchPredicate parse(std::string_view text);

    bool is_term() const { return std::holds_alternative<TermText>(value); }

    const std::string &term_text() const { return std::get<TermText>(value).text; }

    const Pattern &get_pattern() const { return std::get<Pattern>(value); }

    std::string as_string() const;

    bool operator<(const MatchPredicate &other) const {
        return value < other.value;
    }

    bool operator==(const MatchPredicate &other) const {
        return value == other.value;
    }
};

using MatchPredicateSet = std::set<MatchPredicate>;

MatchPredicateSet make_predicate_set(const std::vector<std::string> &patterns);

MatchPredicateSet make_predicate_set(std::initializer_list<std::string_view> patterns);

#endif //TOKENMATCHER_PATTERN_H
