#include "tuscan/motif_scanner.hpp"
#include <cstdint>

namespace tuscan {

namespace {

inline bool is_base(char c) {
    return c == 'A' || c == 'C' || c == 'G' || c == 'T';
}

}  // namespace

bool MotifScanner::matches_at(std::string_view seq, size_t offset) {
    if (seq.size() < MATCH_FOOTPRINT || offset > seq.size() - MATCH_FOOTPRINT) {
        return false;
    }
    if (seq[offset + CORE_LENGTH] != 'G' || seq[offset + CORE_LENGTH + 1] != 'G') {
        return false;
    }
    for (size_t i = offset; i < offset + MATCH_FOOTPRINT; ++i) {
        if (!is_base(seq[i])) return false;
    }
    return true;
}

size_t MotifScanner::scan(std::string_view seq, Strand strand, const HitCallback& on_hit) {
    const size_t n = seq.size();
    if (n < MATCH_FOOTPRINT) return 0;

    // last_bad = index of the most recent non-ACGT character at or before the
    // footprint end; a footprint [i, i+30) is clean when last_bad < i.
    int64_t last_bad = -1;
    for (size_t j = 0; j + 1 < MATCH_FOOTPRINT; ++j) {
        if (!is_base(seq[j])) last_bad = static_cast<int64_t>(j);
    }

    size_t hits = 0;
    Candidate cand;
    cand.strand = strand;
    for (size_t i = 0; i + MATCH_FOOTPRINT <= n; ++i) {
        const size_t tail = i + MATCH_FOOTPRINT - 1;
        if (!is_base(seq[tail])) last_bad = static_cast<int64_t>(tail);

        if (last_bad >= static_cast<int64_t>(i)) continue;
        if (seq[i + CORE_LENGTH] != 'G' || seq[i + CORE_LENGTH + 1] != 'G') continue;

        cand.offset = i;
        cand.window = Window(seq.substr(i, WINDOW_LENGTH));
        ++hits;
        if (!on_hit(cand)) break;
    }
    return hits;
}

std::vector<Candidate> MotifScanner::find_all(std::string_view seq, Strand strand) {
    std::vector<Candidate> hits;
    scan(seq, strand, [&hits](const Candidate& c) {
        hits.push_back(c);
        return true;
    });
    return hits;
}

}  // namespace tuscan
