#ifndef TOKENMATCHER_DOCFREQRECIPROCAL_H
#define TOKENMATCHER_DOCFREQRECIPROCAL_H

#include <cstdint>
#include <optional>
#include <string>
#include <compare>

/**
 * Reciprocal of the doc freq, used to score snippet fragments. Rarer terms score higher.
 *
 * A doc freq of 1 yields 1/2, a doc freq of 2 yields 1/3, etc. A doc freq of 0 has no reciprocal.
 */
struct DocFreqReciprocal {
    float value;

    static std::optional<DocFreqReciprocal> from_doc_freq(uint64_t doc_freq) {
        if (doc_freq == 0) return std::nullopt;
        return DocFreqReciprocal{1.0F / (static_cast<float>(doc_freq) + 1.0F)};
    }

    auto operator<=>(const DocFreqReciprocal &other) const = default;
};

/**
 * Outcome of looking up one token:
 *  - no predicate matched
 *  - a predicate matched, but the frequency source has never seen the token
 *  - a predicate matched, with a reciprocal
 */
class LookupResult {
public:
    enum class Kind : uint8_t {
        NO_MATCH,
        MATCHED_WITHOUT_DOC_FREQ,
        MATCHED
    };

private:
    Kind kind_ = Kind::NO_MATCH;
    DocFreqReciprocal reciprocal_{0};

    LookupResult(Kind kind, DocFreqReciprocal reciprocal) : kind_(kind), reciprocal_(reciprocal) {};

public:
    LookupResult() = default;

    static LookupResult no_match() { return {}; }

    static LookupResult matched_without_doc_freq() { return {Kind::MATCHED_WITHOUT_DOC_FREQ, {0}}; }

    static LookupResult matched(DocFreqReciprocal reciprocal) { return {Kind::MATCHED, reciprocal}; }

    // Result for a token that matched a predicate.
    static LookupResult from_reciprocal(std::optional<DocFreqReciprocal> reciprocal) {
        if (reciprocal) return matched(*reciprocal);
        return matched_without_doc_freq();
    }

    static LookupResult from_doc_freq(uint64_t doc_freq) {
        return from_reciprocal(DocFreqReciprocal::from_doc_freq(doc_freq));
    }

    Kind kind() const { return kind_; }

    bool is_match() const { return kind_ != Kind::NO_MATCH; }

    bool has_reciprocal() const { return kind_ == Kind::MATCHED; }

    std::optional<DocFreqReciprocal> reciprocal() const {
        if (kind_ == Kind::MATCHED) return reciprocal_;
        return std::nullopt;
    }

    // "-" for no match, "0" for a match without doc freq, otherwise the reciprocal.
    std::string as_string() const;

    bool operator==(const LookupResult &other) const {
        if (kind_ != other.kind_) return false;
        return kind_ != Kind::MATCHED || reciprocal_ == other.reciprocal_;
    }
};

#endif //TOKENMATCHER_DOCFREQRECIPROCAL_H
