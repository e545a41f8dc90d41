#include "all_includes.h"
#include <gtest/gtest.h>

static std::string automaton_expression(std::initializer_list<std::string_view> patterns) {
    return generate_automaton_expression(make_predicate_set(patterns), ".*");
}

static RegexExpression regex_expression(std::initializer_list<std::string_view> patterns) {
    return generate_regex_expression(make_predicate_set(patterns), ".*");
}

TEST(AutomatonExpression, works_with_empty_input) {
    EXPECT_EQ(automaton_expression({}), RegexUtil::NEVER_MATCH_EXPR);
}

TEST(AutomatonExpression, works_with_literal_terms_only) {
    EXPECT_EQ(automaton_expression({"foo", "bar"}), "bar|foo");
}

TEST(AutomatonExpression, shares_one_wildcard_when_every_pattern_is_end_wildcarded) {
    EXPECT_EQ(automaton_expression({"foo*", "bar*", "baz*"}), "((bar|baz|foo).*)");
}

TEST(AutomatonExpression, works_with_types_from_each_group) {
    EXPECT_EQ(automaton_expression({"a", "*b", "c*", "*d*", "e*f", "g", "*h", "i*", "*j*", "k*l"}),
              "a|g|((c|i).*)|(e.*f)|(k.*l)|(.*(b|h))|(.*(d|j).*)");
}

TEST(AutomatonExpression, escapes_literals) {
    EXPECT_EQ(automaton_expression({"o.s.v.", "*lol(?)"}), R"(o\.s\.v\.|(.*(lol\(\?\))))");
}

TEST(AutomatonExpression, uses_configured_wildcard) {
    EXPECT_EQ(generate_automaton_expression(make_predicate_set({"ab*"}), wildcard_expr()),
              R"(((ab)[\x{0000}-\x{024f}]*))");
}

TEST(RegexExpression, anchors_every_alternative) {
    auto expression = regex_expression({"a", "b*", "c*d", "*e", "*f*"});

    EXPECT_EQ(expression.pattern, "^(a)$|^b.*$|^c.*d$|^.*e$|^.*f.*$");
}

TEST(RegexExpression, capture_terms_follow_set_order) {
    auto expression = regex_expression({"zeta", "*x", "alpha", "mid"});

    EXPECT_EQ(expression.pattern, "^(alpha)$|^(mid)$|^(zeta)$|^.*x$");
    EXPECT_EQ(expression.capture_terms, (std::vector<std::string>{"alpha", "mid", "zeta"}));
}

TEST(RegexExpression, escapes_literals) {
    auto expression = regex_expression({"a+b", "(c)*"});

    EXPECT_EQ(expression.pattern, R"(^(a\+b)$|^\(c\).*$)");
}

TEST(RegexExpression, works_with_empty_input) {
    auto expression = regex_expression({});

    EXPECT_EQ(expression.pattern, RegexUtil::NEVER_MATCH_EXPR);
    EXPECT_TRUE(expression.capture_terms.empty());
}

// The parser collapses "**", so these are built by hand.
static MatchPredicateSet with_wildcard_runs(std::initializer_list<std::string_view> patterns) {
    auto set = make_predicate_set(patterns);
    set.insert(MatchPredicate::pattern(Pattern(std::vector<PatternNode>{Wildcard{}, Wildcard{}})));
    set.insert(MatchPredicate::pattern(Pattern(std::vector<PatternNode>{Wildcard{}, Wildcard{}, Wildcard{}})));
    return set;
}

TEST(AutomatonExpression, wildcard_runs_add_no_empty_alternative) {
    EXPECT_EQ(generate_automaton_expression(with_wildcard_runs({"foo"}), ".*"), "foo");
    EXPECT_EQ(generate_automaton_expression(with_wildcard_runs({}), ".*"), RegexUtil::NEVER_MATCH_EXPR);
    EXPECT_EQ(generate_automaton_expression(with_wildcard_runs({"*b*"}), ".*"), "(.*(b).*)");
}

TEST(RegexExpression, wildcard_runs_add_no_empty_alternative) {
    EXPECT_EQ(generate_regex_expression(with_wildcard_runs({"foo"}), ".*").pattern, "^(foo)$");
    EXPECT_EQ(generate_regex_expression(with_wildcard_runs({}), ".*").pattern, RegexUtil::NEVER_MATCH_EXPR);
}
