#pragma once

#include "tuscan/feature_matrix.hpp"
#include "tuscan/types.hpp"
#include <string>
#include <vector>

namespace tuscan {

/**
 * Candidate window -> model feature vector.
 *
 * Layout (0-based):
 *   [0]      GC percentage over the window, rounded to 2 decimals
 *   [1..4]   counts of A, C, G, T
 *   then     dinucleotide presence anywhere in the window
 *   then     nucleotide-at-position indicators
 *   then     dinucleotide-at-position indicators
 *   then     (Regression only) window[24..27] == "TGGT"
 *
 * Tables per mode are in feature_tables.hpp. Encoding is pure and
 * thread-safe; one encoder can be shared by all workers.
 */
class FeatureEncoder {
public:
    explicit FeatureEncoder(ScoringMode mode) : mode_(mode) {}

    ScoringMode mode() const { return mode_; }
    size_t num_features() const { return feature_count(mode_); }

    static size_t feature_count(ScoringMode mode);

    // Write num_features() values to out
    void encode(const Window& window, float* out) const;

    std::vector<float> encode(const Window& window) const;

    // One row per candidate, in input order
    void encode_batch(const std::vector<Candidate>& batch, FeatureMatrix& matrix) const;

    // Column names for feature matrix headers ("GC_", "A", "CA", "C7", "CT7", "TGGT")
    std::vector<std::string> feature_names() const;

private:
    ScoringMode mode_;
};

}  // namespace tuscan
