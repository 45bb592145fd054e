#pragma once

#include "tuscan/types.hpp"
#include <memory>
#include <string>

namespace tuscan {

/**
 * Column-aligned site report
 *
 * Scan layout:
 *   Chromosome  Start  End  Strand  Sequence  Score
 * Score layout (pre-cut sequences):
 *   ID  Sequence  Score  Dir
 *
 * A filename of "-" writes to stdout. Write failures throw std::runtime_error.
 */
class ReportWriter {
public:
    enum class Layout { SCAN, SEQUENCES };

    ReportWriter(const std::string& filename, Layout layout);
    ~ReportWriter();

    void write_header();

    // Scan layout row
    void write_site(const ScoredCandidate& site);

    // Sequences layout row
    void write_sequence(const std::string& id, const std::string& sequence,
                        float score, Strand dir);

    size_t rows_written() const;

    // Flush and close; throws if any buffered write failed
    void close();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// Default report name when -o is not given
constexpr const char* DEFAULT_REPORT_NAME = "TUSCAN_output.txt";

}  // namespace tuscan
