#ifndef TOKENMATCHER_AUTOMATONMATCHER_H
#define TOKENMATCHER_AUTOMATONMATCHER_H

#include <memory>
#include <optional>
#include <string>
#include <re2/re2.h>
#include "TokenMatcher.h"
#include "Pattern.h"
#include "Term.h"

std::string generate_automaton_expression(const MatchPredicateSet &predicate_set, std::string_view wildcard_expr);

/**
 * RE2 program run anchored at the start with leftmost-longest semantics and without capture groups, which keeps
 * matching on RE2's DFA. It cannot tell which predicate matched.
 *
 * Compiling only parses and builds the program. DFA states are built lazily while matching, under RE2's internal
 * lock, and the state cache is shared by every matcher using this automaton, so repeated tokens get cheaper over
 * time. max_mem bounds that cache.
 */
class Automaton {
    RE2 dfa;

public:
    Automaton(const std::string &expression, const RE2::Options &options);

    const RE2 &get_regex() const { return dfa; }

    // Length of the longest prefix of input that matches, if any.
    std::optional<std::size_t> find(std::string_view input) const;
};

// Throws CompileError. Compile once per predicate set and share the result so matchers share the DFA cache.
std::shared_ptr<const Automaton> compile_automaton(const MatchPredicateSet &predicate_set);

class AutomatonMatcher : public TokenMatcher {
    std::shared_ptr<const Automaton> automaton;
    TokenCache doc_freq_cache;
    Term term_buf;

    const Term &text_term(std::string_view token_text);

public:
    AutomatonMatcher(std::shared_ptr<const Automaton> automaton, const MatchPredicateSet &predicate_set,
                     const TermDocFreqReciprocals &term_doc_freq_reciprocals);

    LookupResult lookup_doc_freq_reciprocal(std::string_view token_text, const DocFreqSource &source) override;

    std::size_t cache_size() const { return doc_freq_cache.size(); }
};

#endif //TOKENMATCHER_AUTOMATONMATCHER_H
