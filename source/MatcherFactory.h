#ifndef TOKENMATCHER_MATCHERFACTORY_H
#define TOKENMATCHER_MATCHERFACTORY_H

#include <memory>
#include <optional>
#include <string_view>
#include "TokenMatcher.h"
#include "Pattern.h"

class CompiledRegex;
class Automaton;

enum class MatcherBackend {
    HASH,
    REGEX,
    AUTOMATON
};

std::string_view backend_name(MatcherBackend backend);

std::optional<MatcherBackend> parse_backend(std::string_view name);

bool has_wildcard_patterns(const MatchPredicateSet &predicate_set);

/**
 * Hash when there are no wildcards. Otherwise the automaton if enough tokens are expected to warm up its lazily
 * built DFA, else the regex.
 */
MatcherBackend choose_backend(const MatchPredicateSet &predicate_set, uint64_t expected_tokens);

// Asks the source once for every plain term. Terms it has never seen are left out.
TermDocFreqReciprocals compute_term_doc_freq_reciprocals(const MatchPredicateSet &predicate_set,
                                                         const DocFreqSource &source);

/**
 * Compiles a predicate set once and hands out matchers sharing the compiled expression.
 * new_matcher() can be called from any thread; each matcher must stay on one thread.
 */
class CompiledMatcherFactory {
    MatcherBackend backend;
    MatchPredicateSet predicate_set;
    TermDocFreqReciprocals term_doc_freq_reciprocals;

    std::shared_ptr<const CompiledRegex> regex;
    std::shared_ptr<const Automaton> automaton;

public:
    // Throws CompileError.
    CompiledMatcherFactory(MatcherBackend backend, MatchPredicateSet predicate_set, const DocFreqSource &source);

    std::unique_ptr<TokenMatcher> new_matcher() const;

    MatcherBackend get_backend() const { return backend; }
};

std::unique_ptr<TokenMatcher> make_matcher(MatcherBackend backend, const MatchPredicateSet &predicate_set,
                                           const DocFreqSource &source);

#endif //TOKENMATCHER_MATCHERFACTORY_H
