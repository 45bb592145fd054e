#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tuscan {

// Candidate window geometry
constexpr size_t WINDOW_LENGTH = 28;     // 25-nt core + GG + 1
constexpr size_t CORE_LENGTH = 25;       // Upstream of the GG anchor
constexpr size_t TRAILING_CONTEXT = 3;   // Nucleotides required after GG
constexpr size_t MATCH_FOOTPRINT = CORE_LENGTH + 2 + TRAILING_CONTEXT;  // 30

// Scoring batch policy
constexpr size_t DEFAULT_BATCH_SIZE = 10000;

enum class Strand : uint8_t {
    FORWARD,
    REVERSE
};

inline char strand_symbol(Strand s) {
    return s == Strand::FORWARD ? '+' : '-';
}

enum class ScoringMode {
    REGRESSION,
    CLASSIFICATION
};

// Parse "Regression"/"Classification" (case-insensitive). Returns false when unknown.
bool parse_scoring_mode(const std::string& text, ScoringMode& mode);
const char* scoring_mode_name(ScoringMode mode);

/**
 * Fixed-width candidate window.
 * Always exactly WINDOW_LENGTH nucleotides; constructed only from a valid slice.
 */
class Window {
public:
    Window() { bases_.fill('A'); }

    // Copies the first WINDOW_LENGTH characters; seq must have at least that many.
    explicit Window(std::string_view seq);

    char operator[](size_t i) const { return bases_[i]; }
    std::string_view view() const { return std::string_view(bases_.data(), bases_.size()); }
    std::string str() const { return std::string(bases_.data(), bases_.size()); }

    bool operator==(const Window& other) const { return bases_ == other.bases_; }

private:
    std::array<char, WINDOW_LENGTH> bases_;
};

// One scanner hit on a single strand
struct Candidate {
    uint64_t offset = 0;    // Match start within the scanned strand
    Window window;
    Strand strand = Strand::FORWARD;
};

// Genomic region backing a scanned sequence (BED-style, half-open, 0-based)
struct Region {
    std::string chrom;
    uint64_t start = 0;
    uint64_t end = 0;
};

struct ScoredCandidate {
    std::string chrom;
    uint64_t start = 0;     // 1-based inclusive
    uint64_t end = 0;       // 1-based inclusive
    Strand strand = Strand::FORWARD;
    Window window;
    float score = 0.0f;
};

// Reported span of a candidate: 20-nt protospacer plus NGG, 1-based inclusive
struct SiteSpan {
    uint64_t start;
    uint64_t end;
};

SiteSpan site_span(const Region& region, uint64_t offset, Strand strand);

}  // namespace tuscan
