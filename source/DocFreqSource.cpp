#include "DocFreqSource.h"
#include <sstream>
#include <stdexcept>
#include "logger.h"

uint64_t MapDocFreqSource::get_doc_freq(const Term &term) const {
    lookup_count.fetch_add(1, std::memory_order_relaxed);

    auto it = freqs.find(term.text());
    if (it == freqs.end()) return 0;
    return it->second;
}

void MapDocFreqSource::set(std::string term, uint64_t doc_freq) {
    freqs[std::move(term)] = doc_freq;
}

void MapDocFreqSource::load(std::istream &stream) {
    std::string line;
    int line_no = 0;
    while (std::getline(stream, line)) {
        line_no++;
        auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') continue;

        std::istringstream ls(line);
        std::string term;
        uint64_t freq;
        if (!(ls >> term >> freq)) {
            throw std::runtime_error("Malformed doc freq line " + std::to_string(line_no) + ": " + line);
        }
        set(std::move(term), freq);
    }

    log("Loaded doc freqs:", freqs.size());
}
