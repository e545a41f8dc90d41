#include "HashMatcher.h"
#include "RegexUtil.h"
#include "logger.h"

HashMatcher::HashMatcher(const MatchPredicateSet &predicate_set,
                         const TermDocFreqReciprocals &term_doc_freq_reciprocals) {
    auto groups = RegexUtil::GroupedPatterns::group(predicate_set);
    term_results.reserve(groups.terms.size());

    for (auto term : groups.terms) {
        auto it = term_doc_freq_reciprocals.find(term);
        auto result = it == term_doc_freq_reciprocals.end() ? LookupResult::matched_without_doc_freq()
                                                            : LookupResult::matched(it->second);
        term_results.emplace(std::string(term), result);
    }

    if (auto ignored = groups.size() - groups.terms.size()) {
        log("HashMatcher ignores wildcard patterns:", ignored);
    }
}

LookupResult HashMatcher::lookup_doc_freq_reciprocal(std::string_view token_text, const DocFreqSource &) {
    auto it = term_results.find(token_text);
    if (it == term_results.end()) return LookupResult::no_match();
    return it->second;
}
