#ifndef TOKENMATCHER_TERM_H
#define TOKENMATCHER_TERM_H

#include <vector>
#include <string_view>
#include <cstdint>

/**
 * A search term as handed to the document frequency source: the raw bytes of the token.
 * Matchers keep one of these around as a scratch buffer, so set_text reuses the allocation.
 */
class Term {
    std::vector<uint8_t> bytes;

public:
    Term() = default;

    explicit Term(std::string_view text) {
        set_text(text);
    }

    void set_text(std::string_view text) {
        bytes.assign(text.begin(), text.end());
    }

    std::string_view text() const {
        return {reinterpret_cast<const char *>(bytes.data()), bytes.size()};
    }

    const std::vector<uint8_t> &as_bytes() const { return bytes; }
};

#endif //TOKENMATCHER_TERM_H
