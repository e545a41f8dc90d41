#include "RegexMatcher.h"
#include <fmt/format.h>
#include "RegexUtil.h"
#include "Constants.h"
#include "PerfTimer.h"
#include "logger.h"

static std::string quote_meta(std::string_view text) {
    return RE2::QuoteMeta(re2::StringPiece(text.data(), text.size()));
}

// Every alternative is anchored at both ends: RE2 searches for substrings, but a predicate has to match the
// whole token.
RegexExpression generate_regex_expression(const MatchPredicateSet &predicate_set, std::string_view wildcard_expr) {
    auto groups = RegexUtil::GroupedPatterns::group(predicate_set);
    RegexExpression expression;

    auto alternatives = [&](const std::vector<RegexUtil::NodeSpan> &group, std::string_view before,
                            std::string_view after) -> std::optional<std::string> {
        std::vector<std::string> exprs;
        for (auto nodes : group) {
            if (auto expr = RegexUtil::pattern_to_expr(nodes, wildcard_expr, quote_meta)) {
                exprs.push_back(fmt::format("^{}{}{}$", before, *expr, after));
            }
        }
        if (exprs.empty()) return std::nullopt;
        return fmt::format("{}", fmt::join(exprs, "|"));
    };

    std::optional<std::string> terms_expr;
    if (!groups.terms.empty()) {
        std::vector<std::string> exprs;
        for (auto term : groups.terms) {
            exprs.push_back(fmt::format("^({})$", quote_meta(term)));
            expression.capture_terms.emplace_back(term);
        }
        terms_expr = fmt::format("{}", fmt::join(exprs, "|"));
    }

    expression.pattern = RegexUtil::join_alternatives({
                                                              terms_expr,
                                                              alternatives(groups.terms_wc, "", wildcard_expr),
                                                              alternatives(groups.terms_internal_wc, "", ""),
                                                              alternatives(groups.wc_terms, wildcard_expr, ""),
                                                              alternatives(groups.wc_terms_wc, wildcard_expr,
                                                                           wildcard_expr),
                                                      });
    return expression;
}

CompiledRegex::CompiledRegex(const RegexExpression &expression, const RE2::Options &options)
        : regex(expression.pattern, options), capture_terms(expression.capture_terms) {}

std::shared_ptr<const CompiledRegex> compile_regex(const MatchPredicateSet &predicate_set) {
    PerfTimer perf_timer;
    auto expression = generate_regex_expression(predicate_set, wildcard_expr());
    log("re pattern:", expression.pattern);

    RE2::Options options;
    options.set_log_errors(false);

    auto compiled = std::make_shared<const CompiledRegex>(expression, options);
    auto &regex = compiled->get_regex();

    if (!regex.ok()) {
        auto message = fmt::format("compile_regex failed. {}", regex.error());
        log_error(message);
        throw CompileError(message);
    }

    // Scoring relies on capture group i + 1 belonging to capture_terms[i].
    auto groups = static_cast<std::size_t>(regex.NumberOfCapturingGroups());
    if (groups != compiled->get_capture_terms().size()) {
        auto message = fmt::format("compile_regex failed. {} capture groups for {} terms", groups,
                                   compiled->get_capture_terms().size());
        log_error(message);
        throw CompileError(message);
    }

    perf_timer.add_milestone("re::comp");
    log("re compiled, program size:", regex.ProgramSize(), perf_timer.as_string());
    return compiled;
}

RegexMatcher::RegexMatcher(std::shared_ptr<const CompiledRegex> compiled,
                           const TermDocFreqReciprocals &term_doc_freq_reciprocals)
        : compiled(std::move(compiled)) {
    auto &capture_terms = this->compiled->get_capture_terms();

    term_results.reserve(capture_terms.size());
    for (auto &term : capture_terms) {
        auto it = term_doc_freq_reciprocals.find(term);
        term_results.push_back(it == term_doc_freq_reciprocals.end() ? LookupResult::matched_without_doc_freq()
                                                                     : LookupResult::matched(it->second));
    }

    // Slot 0 is the whole match.
    capture_locations_buf.resize(capture_terms.size() + 1);
}

const Term &RegexMatcher::text_term(std::string_view token_text) {
    term_buf.set_text(token_text);
    return term_buf;
}

LookupResult RegexMatcher::lookup_doc_freq_reciprocal(std::string_view token_text, const DocFreqSource &source) {
    re2::StringPiece text(token_text.data(), token_text.size());
    auto &regex = compiled->get_regex();

    if (!regex.Match(text, 0, text.size(), RE2::UNANCHORED, capture_locations_buf.data(),
                     static_cast<int>(capture_locations_buf.size()))) {
        return LookupResult::no_match();
    }

    // The first populated term group tells which term matched.
    for (std::size_t term_index = 0; term_index < term_results.size(); term_index++) {
        if (capture_locations_buf[term_index + 1].data() != nullptr) {
            return term_results[term_index];
        }
    }

    // A wildcard pattern matched.
    if (auto it = pattern_doc_freq_cache.find(token_text); it != pattern_doc_freq_cache.end()) {
        return it->second;
    }

    auto result = LookupResult::from_doc_freq(source.get_doc_freq(text_term(token_text)));
    pattern_doc_freq_cache.emplace(std::string(token_text), result);
    return result;
}
