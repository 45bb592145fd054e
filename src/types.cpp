#include "tuscan/types.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <stdexcept>

namespace tuscan {

bool parse_scoring_mode(const std::string& text, ScoringMode& mode) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "regression") {
        mode = ScoringMode::REGRESSION;
        return true;
    }
    if (lower == "classification") {
        mode = ScoringMode::CLASSIFICATION;
        return true;
    }
    return false;
}

const char* scoring_mode_name(ScoringMode mode) {
    return mode == ScoringMode::REGRESSION ? "Regression" : "Classification";
}

Window::Window(std::string_view seq) {
    if (seq.size() < WINDOW_LENGTH) {
        throw std::invalid_argument("Candidate window needs " + std::to_string(WINDOW_LENGTH) +
                                    " nucleotides, got " + std::to_string(seq.size()));
    }
    std::memcpy(bases_.data(), seq.data(), WINDOW_LENGTH);
}

SiteSpan site_span(const Region& region, uint64_t offset, Strand strand) {
    // Window index 4 through 26 (protospacer + NGG). On the reverse strand
    // those indices are mirrored back onto the forward reference.
    SiteSpan span;
    if (strand == Strand::FORWARD) {
        span.start = region.start + offset + 5;
    } else {
        span.start = region.end - offset - 26;
    }
    span.end = span.start + 22;
    return span;
}

}  // namespace tuscan
