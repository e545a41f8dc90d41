#ifndef TOKENMATCHER_REGEXMATCHER_H
#define TOKENMATCHER_REGEXMATCHER_H

#include <memory>
#include <string>
#include <vector>
#include <re2/re2.h>
#include "TokenMatcher.h"
#include "Pattern.h"
#include "Term.h"

/**
 * A regex for a predicate set, together with the plain terms its capture groups stand for.
 * Capture group i + 1 is capture_terms[i].
 */
struct RegexExpression {
    std::string pattern;
    std::vector<std::string> capture_terms;
};

RegexExpression generate_regex_expression(const MatchPredicateSet &predicate_set, std::string_view wildcard_expr);

class CompiledRegex {
    RE2 regex;
    std::vector<std::string> capture_terms;

public:
    CompiledRegex(const RegexExpression &expression, const RE2::Options &options);

    const RE2 &get_regex() const { return regex; }

    const std::vector<std::string> &get_capture_terms() const { return capture_terms; }
};

// Throws CompileError.
std::shared_ptr<const CompiledRegex> compile_regex(const MatchPredicateSet &predicate_set);

/**
 * Matches tokens with RE2. Plain terms are found through their capture group, which points straight at the
 * precomputed reciprocal. Tokens matched by wildcard patterns go through the cache and then the doc freq source.
 */
class RegexMatcher : public TokenMatcher {
    std::shared_ptr<const CompiledRegex> compiled;
    std::vector<re2::StringPiece> capture_locations_buf;

    // Indexed by capture group - 1.
    std::vector<LookupResult> term_results;
    TokenCache pattern_doc_freq_cache;

    Term term_buf;

    const Term &text_term(std::string_view token_text);

public:
    RegexMatcher(std::shared_ptr<const CompiledRegex> compiled, const TermDocFreqReciprocals &term_doc_freq_reciprocals);

    LookupResult lookup_doc_freq_reciprocal(std::string_view token_text, const DocFreqSource &source) override;

    std::size_t cache_size() const { return pattern_doc_freq_cache.size(); }
};

#endif //TOKENMATCHER_REGEXMATCHER_H
