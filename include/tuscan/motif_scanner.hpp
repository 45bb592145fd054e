#pragma once

#include "tuscan/types.hpp"
#include <functional>
#include <string_view>
#include <vector>

namespace tuscan {

/**
 * Candidate site scanner for the N25-GG-N3 motif.
 *
 * Every offset i with seq[i+25..i+26] == "GG" and all 30 nucleotides of
 * seq[i..i+29] in {A,C,G,T} is a hit; hits overlap freely. The window
 * reported for a hit is seq[i..i+27].
 *
 * Positions containing any other character (N, IUPAC codes, lowercase that
 * was not normalised) never match.
 */
class MotifScanner {
public:
    // Return false from the callback to stop scanning early
    using HitCallback = std::function<bool(const Candidate&)>;

    /**
     * Scan one strand, calling `on_hit` for each match in ascending offset order.
     * Returns the number of hits delivered.
     */
    static size_t scan(std::string_view seq, Strand strand, const HitCallback& on_hit);

    /**
     * Collect all hits on one strand
     */
    static std::vector<Candidate> find_all(std::string_view seq, Strand strand);

    /**
     * Check the anchor and alphabet at a single offset
     */
    static bool matches_at(std::string_view seq, size_t offset);
};

}  // namespace tuscan
