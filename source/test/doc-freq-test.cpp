#include "all_includes.h"
#include <gtest/gtest.h>
#include <sstream>
#include <thread>

TEST(DocFreqReciprocal, known_values) {
    EXPECT_EQ(DocFreqReciprocal::from_doc_freq(1)->value, 0.5F);
    EXPECT_EQ(DocFreqReciprocal::from_doc_freq(2)->value, 1.0F / 3.0F);
    EXPECT_FALSE(DocFreqReciprocal::from_doc_freq(0).has_value());
}

TEST(DocFreqReciprocal, strictly_decreasing) {
    auto prev = *DocFreqReciprocal::from_doc_freq(1);
    for (uint64_t doc_freq = 2; doc_freq < 5000; doc_freq++) {
        auto current = *DocFreqReciprocal::from_doc_freq(doc_freq);
        ASSERT_LT(current, prev) << "doc freq " << doc_freq;
        ASSERT_GT(current.value, 0);
        prev = current;
    }
}

TEST(LookupResult, three_outcomes) {
    auto no_match = LookupResult::no_match();
    auto without = LookupResult::from_doc_freq(0);
    auto matched = LookupResult::from_doc_freq(1);

    EXPECT_EQ(no_match.kind(), LookupResult::Kind::NO_MATCH);
    EXPECT_FALSE(no_match.is_match());

    EXPECT_EQ(without.kind(), LookupResult::Kind::MATCHED_WITHOUT_DOC_FREQ);
    EXPECT_TRUE(without.is_match());
    EXPECT_FALSE(without.reciprocal().has_value());

    EXPECT_EQ(matched.kind(), LookupResult::Kind::MATCHED);
    EXPECT_EQ(matched.reciprocal()->value, 0.5F);

    EXPECT_NE(no_match, without);
    EXPECT_NE(without, matched);
    EXPECT_EQ(matched, LookupResult::matched(DocFreqReciprocal{0.5F}));
}

TEST(LookupResult, as_string) {
    EXPECT_EQ(LookupResult::no_match().as_string(), "-");
    EXPECT_EQ(LookupResult::matched_without_doc_freq().as_string(), "0");
    EXPECT_EQ(LookupResult::from_doc_freq(3).as_string(), "0.250000");
}

TEST(MapDocFreqSource, returns_zero_for_unseen_terms) {
    MapDocFreqSource source{{"foo", 1}, {"bar", 2}};

    EXPECT_EQ(source.get_doc_freq(Term("foo")), 1);
    EXPECT_EQ(source.get_doc_freq(Term("bar")), 2);
    EXPECT_EQ(source.get_doc_freq(Term("baz")), 0);
    EXPECT_EQ(source.lookups(), 3);
}

TEST(MapDocFreqSource, counts_lookups_from_many_threads) {
    constexpr int THREADS = 4;
    constexpr int LOOKUPS = 5000;
    MapDocFreqSource source{{"foo", 1}};

    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; t++) {
        threads.emplace_back([&] {
            Term term("foo");
            repeat(LOOKUPS, [&](int) { EXPECT_EQ(source.get_doc_freq(term), 1); });
        });
    }
    for (auto &thread : threads) thread.join();

    EXPECT_EQ(source.lookups(), THREADS * LOOKUPS);
}

TEST(MapDocFreqSource, loads_term_freq_lines) {
    std::istringstream in("# term freq\nfoo 1\n\n  bar 20\nbaz\t3\n");
    MapDocFreqSource source;
    source.load(in);

    EXPECT_EQ(source.size(), 3);
    EXPECT_EQ(source.get_doc_freq(Term("bar")), 20);
    EXPECT_EQ(source.get_doc_freq(Term("baz")), 3);
}

TEST(MapDocFreqSource, malformed_line_throws) {
    std::istringstream in("foo 1\nbar lots\n");
    MapDocFreqSource source;

    EXPECT_THROW(source.load(in), std::runtime_error);
}

TEST(Term, reuses_buffer) {
    Term term("longer text");
    term.set_text("abc");

    EXPECT_EQ(term.text(), "abc");
    EXPECT_EQ(term.as_bytes().size(), 3);
}
