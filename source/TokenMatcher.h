#ifndef TOKENMATCHER_TOKENMATCHER_H
#define TOKENMATCHER_TOKENMATCHER_H

#include <string_view>
#include <stdexcept>
#include "DocFreqReciprocal.h"
#include "DocFreqSource.h"

// Token text -> result of an earlier lookup.
using TokenCache = StringMap<LookupResult>;

// Precomputed reciprocals for the plain terms of a predicate set.
using TermDocFreqReciprocals = StringMap<DocFreqReciprocal>;

/**
 * What snippet generators and highlighters use to score tokens against the predicates of a query.
 *
 * Lookups are non-const because matchers cache results as they go. One instance per thread; the compiled
 * expressions behind them are shared.
 */
class TokenMatcher {
public:
    virtual ~TokenMatcher() = default;

    virtual LookupResult lookup_doc_freq_reciprocal(std::string_view token_text, const DocFreqSource &source) = 0;
};

// A synthesized expression could not be compiled.
class CompileError : public std::runtime_error {
public:
    explicit CompileError(const std::string &message) : std::runtime_error(message) {};
};

#endif //TOKENMATCHER_TOKENMATCHER_H
