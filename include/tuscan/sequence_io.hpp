#pragma once

#include <memory>
#include <string>
#include <vector>

namespace tuscan {

/**
 * Sequence record from a FASTA file
 */
struct SequenceRecord {
    std::string id;
    std::string description;
    std::string sequence;
};

/**
 * FASTA file reader
 *
 * Supports:
 * - Uncompressed and gzip-compressed files (magic bytes, not extension)
 * - Multi-line records
 * - Parallel decompression through rapidgzip when built with HAVE_RAPIDGZIP
 */
class SequenceReader {
public:
    /**
     * Open a FASTA file. Throws std::runtime_error when it cannot be opened.
     */
    explicit SequenceReader(const std::string& filename);
    ~SequenceReader();

    /**
     * Read next record
     * Returns false when end of file is reached
     */
    bool read_next(SequenceRecord& record);

    std::vector<SequenceRecord> read_all();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * Sequence utilities
 */
class SequenceUtils {
public:
    /**
     * Reverse complement a DNA sequence. Characters outside ACGT/acgt are kept
     * as-is, so reverse_complement(reverse_complement(s)) == s for any input.
     */
    static std::string reverse_complement(const std::string& seq);

    /**
     * Remove whitespace and convert to uppercase
     */
    static std::string clean(const std::string& seq);

    /**
     * True when every character is one of A, C, G, T (uppercase)
     */
    static bool is_acgt(const std::string& seq);

    static char complement(char nt);
};

}  // namespace tuscan
