#pragma once

/**
 * @file guide_reader.hpp
 * @brief Pre-cut 30-mer input for `tuscan score` and `tuscan features`
 *
 * A 30-mer is 25 nt + GG + 3 nt. Input is either one sequence per line or a
 * FASTA file (plain or gzip). Sequences whose GG sits at 25-26 only on the
 * reverse complement are reoriented and tagged REVERSE. Rejected lines are
 * reported through the warning callback and skipped.
 */

#include "tuscan/types.hpp"
#include <functional>
#include <string>
#include <vector>

namespace tuscan {

enum class GuideCheck {
    OK,
    INVALID_NUCLEOTIDE,
    BAD_LENGTH,
    NO_PAM
};

struct GuideRecord {
    std::string id;          // FASTA id, or the line number for plain text
    std::string sequence;    // 30 nt, oriented so the PAM GG is at 25-26
    Strand dir = Strand::FORWARD;
    size_t line = 0;         // 1-based input line (FASTA: record number)
};

/**
 * Validate and orient one raw sequence (case-insensitive).
 * On OK, `oriented` and `dir` are set.
 */
GuideCheck check_guide(const std::string& raw, std::string& oriented, Strand& dir);

// Called per rejected sequence, and with GuideCheck::OK for reoriented ones
using GuideWarning = std::function<void(GuideCheck check, const std::string& message)>;

/**
 * Read every valid guide from a file. FASTA is detected by a leading '>' or
 * gzip magic. Throws std::runtime_error when the file cannot be opened.
 */
std::vector<GuideRecord> read_guides(const std::string& path, const GuideWarning& warn);

// The 28-nt window the encoder sees for a guide
inline Window guide_window(const GuideRecord& guide) {
    return Window(guide.sequence);
}

}  // namespace tuscan
