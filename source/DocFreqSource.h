#ifndef TOKENMATCHER_DOCFREQSOURCE_H
#define TOKENMATCHER_DOCFREQSOURCE_H

#include <cstdint>
#include <string>
#include <istream>
#include <utility>
#include <initializer_list>
#include <robin_hood/robin_hood.h>
#include <functional>
#include <atomic>
#include <string_view>
#include "Term.h"

// Lets string-keyed maps be probed with a std::string_view, without building a std::string per lookup.
struct StringHash {
    using is_transparent = void;

    std::size_t operator()(std::string_view text) const {
        return robin_hood::hash_bytes(text.data(), text.size());
    }
};

template<typename T>
using StringMap = robin_hood::unordered_map<std::string, T, StringHash, std::equal_to<>>;

/**
 * Where the matchers get corpus document frequencies from. Usually backed by the index searcher.
 * A frequency of 0 means the term was never seen.
 */
class DocFreqSource {
public:
    virtual ~DocFreqSource() = default;

    virtual uint64_t get_doc_freq(const Term &term) const = 0;
};

/**
 * Document frequencies kept in memory. Used by the command line tool and the tests.
 */
class MapDocFreqSource : public DocFreqSource {
    StringMap<uint64_t> freqs;
    // Matchers on different threads may share one source.
    mutable std::atomic<uint64_t> lookup_count = 0;

public:
    MapDocFreqSource() = default;

    MapDocFreqSource(std::initializer_list<std::pair<std::string, uint64_t>> init) {
        for (auto &[term, freq] : init) freqs.emplace(term, freq);
    }

    uint64_t get_doc_freq(const Term &term) const override;

    void set(std::string term, uint64_t doc_freq);

    // Reads "term freq" lines. Blank lines and lines starting with '#' are skipped.
    void load(std::istream &stream);

    std::size_t size() const { return freqs.size(); }

    // Number of get_doc_freq calls so far.
    uint64_t lookups() const { return lookup_count.load(std::memory_order_relaxed); }
};

/**
 * Every term has the same frequency.
 */
class ConstantDocFreqSource : public DocFreqSource {
    uint64_t doc_freq;

public:
    explicit ConstantDocFreqSource(uint64_t doc_freq) : doc_freq(doc_freq) {};

    uint64_t get_doc_freq(const Term &) const override {
        return doc_freq;
    }
};

#endif //TOKENMATCHER_DOCFREQSOURCE_H
