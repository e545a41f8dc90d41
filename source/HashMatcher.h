#ifndef TOKENMATCHER_HASHMATCHER_H
#define TOKENMATCHER_HASHMATCHER_H

#include "TokenMatcher.h"
#include "Pattern.h"

/**
 * Very simple (and fast!) matcher that only works on terms, not patterns.
 * Use it when the query has no wildcards. The map is the cache, so there is nothing else to remember.
 */
class HashMatcher : public TokenMatcher {
    TokenCache term_results;

public:
    HashMatcher(const MatchPredicateSet &predicate_set, const TermDocFreqReciprocals &term_doc_freq_reciprocals);

    LookupResult lookup_doc_freq_reciprocal(std::string_view token_text, const DocFreqSource &source) override;

    std::size_t size() const { return term_results.size(); }
};

#endif //TOKENMATCHER_HASHMATCHER_H
