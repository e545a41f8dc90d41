#include "AutomatonMatcher.h"
#include <fmt/format.h>
#include "RegexUtil.h"
#include "Constants.h"
#include "PerfTimer.h"
#include "logger.h"

static std::string quote_meta(std::string_view text) {
    return RE2::QuoteMeta(re2::StringPiece(text.data(), text.size()));
}

// Alternation of patterns. Patterns of more than one node get their own group.
// Nothing if no pattern in the group produces an expression, e.g. "**" stripped down to an empty run.
static std::optional<std::string> alternation(const std::vector<RegexUtil::NodeSpan> &patterns,
                                              std::string_view wildcard_expr) {
    std::vector<std::string> exprs;
    for (auto nodes : patterns) {
        auto expr = RegexUtil::pattern_to_expr(nodes, wildcard_expr, quote_meta);
        if (!expr) continue;

        if (nodes.size() == 1) exprs.push_back(std::move(*expr));
        else exprs.push_back(fmt::format("({})", *expr));
    }
    if (exprs.empty()) return std::nullopt;
    return fmt::format("{}", fmt::join(exprs, "|"));
}

// No anchors here; the automaton is anchored when it runs, and checks the match length.
std::string generate_automaton_expression(const MatchPredicateSet &predicate_set, std::string_view wildcard_expr) {
    auto groups = RegexUtil::GroupedPatterns::group(predicate_set);

    std::optional<std::string> terms, terms_wc, terms_internal_wc, wc_terms, wc_terms_wc;

    if (!groups.terms.empty()) {
        std::vector<std::string> exprs;
        for (auto term : groups.terms) exprs.push_back(quote_meta(term));
        terms = fmt::format("{}", fmt::join(exprs, "|"));
    }

    // One wildcard shared by the whole group instead of one per pattern.
    if (auto alt = alternation(groups.terms_wc, wildcard_expr)) {
        terms_wc = fmt::format("(({}){})", *alt, wildcard_expr);
    }

    // Internal wildcards sit between different literals for every pattern, so nothing can be shared.
    terms_internal_wc = alternation(groups.terms_internal_wc, wildcard_expr);

    if (auto alt = alternation(groups.wc_terms, wildcard_expr)) {
        wc_terms = fmt::format("({}({}))", wildcard_expr, *alt);
    }

    if (auto alt = alternation(groups.wc_terms_wc, wildcard_expr)) {
        wc_terms_wc = fmt::format("({}({}){})", wildcard_expr, *alt, wildcard_expr);
    }

    return RegexUtil::join_alternatives({terms, terms_wc, terms_internal_wc, wc_terms, wc_terms_wc});
}

Automaton::Automaton(const std::string &expression, const RE2::Options &options) : dfa(expression, options) {}

std::optional<std::size_t> Automaton::find(std::string_view input) const {
    re2::StringPiece text(input.data(), input.size());
    re2::StringPiece match;

    if (!dfa.Match(text, 0, text.size(), RE2::ANCHOR_START, &match, 1)) {
        return std::nullopt;
    }
    return match.size();
}

std::shared_ptr<const Automaton> compile_automaton(const MatchPredicateSet &predicate_set) {
    PerfTimer perf_timer;
    auto expression = generate_automaton_expression(predicate_set, wildcard_expr());
    log("au pattern:", expression);

    RE2::Options options;
    options.set_log_errors(false);
    options.set_longest_match(true);
    options.set_never_capture(true);
    options.set_max_mem(automaton_max_mem);

    // Builds the program only; DFA states come later, while matching.
    auto automaton = std::make_shared<const Automaton>(expression, options);
    auto &dfa = automaton->get_regex();

    if (!dfa.ok()) {
        auto message = fmt::format("compile_automaton failed. {}", dfa.error());
        log_error(message);
        throw CompileError(message);
    }

    perf_timer.add_milestone("au::comp");
    log("au compiled, program size:", dfa.ProgramSize(), perf_timer.as_string());
    return automaton;
}

AutomatonMatcher::AutomatonMatcher(std::shared_ptr<const Automaton> automaton, const MatchPredicateSet &predicate_set,
                                   const TermDocFreqReciprocals &term_doc_freq_reciprocals)
        : automaton(std::move(automaton)) {
    // Plain terms are known up front, so they never reach the doc freq source.
    for (auto term : RegexUtil::GroupedPatterns::group(predicate_set).terms) {
        auto it = term_doc_freq_reciprocals.find(term);
        doc_freq_cache.emplace(std::string(term),
                               it == term_doc_freq_reciprocals.end() ? LookupResult::matched_without_doc_freq()
                                                                     : LookupResult::matched(it->second));
    }
}

const Term &AutomatonMatcher::text_term(std::string_view token_text) {
    term_buf.set_text(token_text);
    return term_buf;
}

LookupResult AutomatonMatcher::lookup_doc_freq_reciprocal(std::string_view token_text, const DocFreqSource &source) {
    auto match_length = automaton->find(token_text);
    if (!match_length || *match_length < token_text.size()) {
        return LookupResult::no_match();
    }

    // We got a match, now need to find doc_freq:
    if (auto it = doc_freq_cache.find(token_text); it != doc_freq_cache.end()) {
        return it->second;
    }

    auto result = LookupResult::from_doc_freq(source.get_doc_freq(text_term(token_text)));
    doc_freq_cache.emplace(std::string(token_text), result);
    return result;
}
