#include "tuscan/orchestrator.hpp"
#include "tuscan/log_utils.hpp"
#include "tuscan/motif_scanner.hpp"
#include "tuscan/sequence_io.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>

namespace tuscan {

PassStats Orchestrator::run_strand(const std::string& strand_seq, Strand strand,
                                   const Region& region,
                                   const ScoringPipeline::RecordSink& sink) const {
    auto pass_start = std::chrono::steady_clock::now();

    auto source = [&strand_seq, strand](const ScoringPipeline::CandidateSink& push) {
        MotifScanner::scan(strand_seq, strand, [&push](const Candidate& c) {
            Candidate copy = c;
            return push(std::move(copy));
        });
    };

    PassStats stats = pipeline_.run_pass(source, region, sink);

    if (verbose_) {
        auto pass_end = std::chrono::steady_clock::now();
        std::cerr << "  [" << strand_symbol(strand) << "] "
                  << log_utils::format_count(stats.candidates) << " candidates, "
                  << stats.batches << " batches, state " << pass_state_name(stats.state)
                  << " (" << log_utils::format_elapsed(pass_start, pass_end) << ", "
                  << log_utils::format_rate(stats.candidates, pass_start, pass_end) << ")\n";
    }
    return stats;
}

TargetStats Orchestrator::run(const ScanTarget& target,
                              const ScoringPipeline::RecordSink& sink) const {
    const Region& region = target.region;
    if (region.end < region.start || region.end - region.start != target.sequence.size()) {
        throw std::invalid_argument("Region " + region.chrom + ":" + std::to_string(region.start) +
                                    "-" + std::to_string(region.end) + " does not match sequence length " +
                                    std::to_string(target.sequence.size()));
    }

    if (verbose_) {
        std::cerr << "Scanning " << region.chrom << ":" << region.start + 1 << "-" << region.end
                  << " (" << log_utils::format_count(target.sequence.size()) << " bp)\n";
    }

    TargetStats stats;
    stats.forward = run_strand(target.sequence, Strand::FORWARD, region, sink);

    // Reverse pass only starts once the forward pipeline is torn down
    const std::string rc = SequenceUtils::reverse_complement(target.sequence);
    stats.reverse = run_strand(rc, Strand::REVERSE, region, sink);
    return stats;
}

}  // namespace tuscan
