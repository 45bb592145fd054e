#pragma once

#include "tuscan/scoring_pipeline.hpp"
#include "tuscan/types.hpp"
#include <string>

namespace tuscan {

// One scanned sequence and the region it came from.
// `sequence` is uppercase; region.end - region.start == sequence.size().
struct ScanTarget {
    Region region;
    std::string sequence;
};

struct TargetStats {
    PassStats forward;
    PassStats reverse;

    size_t candidates() const { return forward.candidates + reverse.candidates; }
    size_t records() const { return forward.records + reverse.records; }
};

/**
 * Runs the forward strand pass, then the reverse-complement pass, each with a
 * freshly created pipeline (threads + queues). The second pass starts only
 * after the first has fully drained.
 */
class Orchestrator {
public:
    Orchestrator(const ScoringPipeline& pipeline, bool verbose)
        : pipeline_(pipeline), verbose_(verbose) {}

    TargetStats run(const ScanTarget& target, const ScoringPipeline::RecordSink& sink) const;

    PassStats run_strand(const std::string& strand_seq, Strand strand, const Region& region,
                         const ScoringPipeline::RecordSink& sink) const;

private:
    const ScoringPipeline& pipeline_;
    bool verbose_;
};

}  // namespace tuscan
