#include "MatcherFactory.h"
#include "HashMatcher.h"
#include "RegexMatcher.h"
#include "AutomatonMatcher.h"
#include "RegexUtil.h"
#include "Constants.h"
#include "logger.h"

std::string_view backend_name(MatcherBackend backend) {
    switch (backend) {
        case MatcherBackend::HASH:
            return "hash";
        case MatcherBackend::REGEX:
            return "regex";
        case MatcherBackend::AUTOMATON:
            return "automaton";
    }
    return "unknown";
}

std::optional<MatcherBackend> parse_backend(std::string_view name) {
    if (name == "hash") return MatcherBackend::HASH;
    if (name == "regex") return MatcherBackend::REGEX;
    if (name == "automaton") return MatcherBackend::AUTOMATON;
    return std::nullopt;
}

bool has_wildcard_patterns(const MatchPredicateSet &predicate_set) {
    auto groups = RegexUtil::GroupedPatterns::group(predicate_set);
    return groups.size() != groups.terms.size();
}

MatcherBackend choose_backend(const MatchPredicateSet &predicate_set, uint64_t expected_tokens) {
    if (!has_wildcard_patterns(predicate_set)) return MatcherBackend::HASH;
    if (expected_tokens >= automaton_token_threshold) return MatcherBackend::AUTOMATON;
    return MatcherBackend::REGEX;
}

TermDocFreqReciprocals compute_term_doc_freq_reciprocals(const MatchPredicateSet &predicate_set,
                                                         const DocFreqSource &source) {
    TermDocFreqReciprocals result;
    Term term_buf;

    for (auto term : RegexUtil::GroupedPatterns::group(predicate_set).terms) {
        term_buf.set_text(term);
        if (auto reciprocal = DocFreqReciprocal::from_doc_freq(source.get_doc_freq(term_buf))) {
            result.emplace(std::string(term), *reciprocal);
        }
    }
    return result;
}

CompiledMatcherFactory::CompiledMatcherFactory(MatcherBackend backend, MatchPredicateSet predicate_set,
                                               const DocFreqSource &source)
        : backend(backend), predicate_set(std::move(predicate_set)) {
    term_doc_freq_reciprocals = compute_term_doc_freq_reciprocals(this->predicate_set, source);

    switch (backend) {
        case MatcherBackend::HASH:
            break;
        case MatcherBackend::REGEX:
            regex = compile_regex(this->predicate_set);
            break;
        case MatcherBackend::AUTOMATON:
            automaton = compile_automaton(this->predicate_set);
            break;
    }

    log("Compiled matcher factory:", backend_name(backend), this->predicate_set.size());
}

std::unique_ptr<TokenMatcher> CompiledMatcherFactory::new_matcher() const {
    switch (backend) {
        case MatcherBackend::HASH:
            return std::make_unique<HashMatcher>(predicate_set, term_doc_freq_reciprocals);
        case MatcherBackend::REGEX:
            return std::make_unique<RegexMatcher>(regex, term_doc_freq_reciprocals);
        case MatcherBackend::AUTOMATON:
            return std::make_unique<AutomatonMatcher>(automaton, predicate_set, term_doc_freq_reciprocals);
    }
    throw std::runtime_error("Unknown matcher backend");
}

std::unique_ptr<TokenMatcher> make_matcher(MatcherBackend backend, const MatchPredicateSet &predicate_set,
                                           const DocFreqSource &source) {
    return CompiledMatcherFactory(backend, predicate_set, source).new_matcher();
}
