#include "DocFreqReciprocal.h"
#include <fmt/format.h>

std::string LookupResult::as_string() const {
    switch (kind_) {
        case Kind::NO_MATCH:
            return "-";
        case Kind::MATCHED_WITHOUT_DOC_FREQ:
            return "0";
        case Kind::MATCHED:
            return fmt::format("{:.6f}", reciprocal_.value);
    }
    return "-";
}
