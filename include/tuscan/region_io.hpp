#pragma once

#include "tuscan/orchestrator.hpp"
#include "tuscan/types.hpp"
#include <functional>
#include <string>
#include <vector>

namespace tuscan {

/**
 * Parse "chr:start-end" (1-based inclusive, thousands separators allowed)
 * into a 0-based half-open region. Throws std::runtime_error on bad input.
 */
Region parse_location(const std::string& location);

/**
 * Read a BED file (>= 3 columns; columns past the third are ignored).
 * Skips blank, '#', "track" and "browser" lines. Throws std::runtime_error
 * naming the line on malformed rows.
 */
std::vector<Region> read_bed(const std::string& path);

/**
 * Cut regions out of a genome FASTA. Only the chromosomes named by the
 * regions are kept in memory. Sequences are uppercased.
 */
std::vector<ScanTarget> fetch_regions(const std::string& genome_fasta,
                                      const std::vector<Region>& regions);

/**
 * Stream every record of a FASTA file as a whole-sequence target
 * (chrom = record id, region [0, length)), one record in memory at a time.
 */
void for_each_fasta_target(const std::string& fasta,
                           const std::function<void(ScanTarget&&)>& callback);

}  // namespace tuscan
