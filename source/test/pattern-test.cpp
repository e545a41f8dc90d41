#include "all_includes.h"
#include <gtest/gtest.h>

TEST(Pattern, parse_splits_literals_and_wildcards) {
    auto pattern = Pattern::parse("f*r");

    ASSERT_EQ(pattern.size(), 3);
    EXPECT_EQ(std::get<Literal>(pattern.nodes[0]).text, "f");
    EXPECT_TRUE(is_wildcard(pattern.nodes[1]));
    EXPECT_EQ(std::get<Literal>(pattern.nodes[2]).text, "r");
    EXPECT_EQ(pattern.as_string(), "f*r");
}

TEST(Pattern, parse_collapses_adjacent_wildcards) {
    auto pattern = Pattern::parse("**ab***c*");

    EXPECT_EQ(pattern.as_string(), "*ab*c*");
    EXPECT_EQ(pattern.size(), 5);
}

TEST(Pattern, predicate_without_wildcard_is_term) {
    auto term = MatchPredicate::parse("foo");
    auto pattern = MatchPredicate::parse("foo*");

    EXPECT_TRUE(term.is_term());
    EXPECT_EQ(term.term_text(), "foo");
    EXPECT_FALSE(pattern.is_term());
    EXPECT_EQ(pattern.as_string(), "foo*");
}

TEST(Pattern, empty_predicate_throws) {
    EXPECT_THROW(MatchPredicate::parse(""), std::runtime_error);
}

TEST(Pattern, terms_sort_before_patterns) {
    auto set = make_predicate_set({"*a", "zzz", "b*", "aaa"});

    std::vector<std::string> order;
    for (auto &p : set) order.push_back(p.as_string());

    // Patterns starting with a literal sort before those starting with a wildcard.
    std::vector<std::string> expected{"aaa", "zzz", "b*", "*a"};
    EXPECT_EQ(order, expected);
}

TEST(Pattern, set_removes_duplicates) {
    auto set = make_predicate_set({"foo", "foo", "a**", "a*"});

    EXPECT_EQ(set.size(), 2);
}

TEST(Pattern, term_and_single_literal_pattern_differ) {
    MatchPredicateSet set;
    set.insert(MatchPredicate::term("foo"));
    set.insert(MatchPredicate::pattern(Pattern({Literal{"foo"}})));

    EXPECT_EQ(set.size(), 2);
    EXPECT_TRUE(set.begin()->is_term());
}
