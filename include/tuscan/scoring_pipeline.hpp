#pragma once

/**
 * @file scoring_pipeline.hpp
 * @brief Producer / worker pool / collector pipeline for one strand pass
 *
 * Architecture:
 * 1. Producer thread runs the candidate source (the motif scanner) and pushes
 *    each Candidate into a bounded work queue (capacity 2 x workers), so the
 *    scanner never runs far ahead of scoring.
 * 2. When the source is exhausted the producer pushes one EndOfStream per
 *    worker.
 * 3. Each worker batches candidates (flush at batch_size or EndOfStream),
 *    encodes the batch, calls the model once, and pushes the ScoredBatch to a
 *    bounded result queue. On EndOfStream it pushes WorkerDone and exits.
 * 4. The collector (calling thread) forwards records to the sink and stops
 *    after one WorkerDone per worker.
 *
 * Ordering: records keep input order within a batch; batches from different
 * workers arrive in completion order.
 *
 * Failure: the first exception on any thread closes both queues, all threads
 * are joined, and the exception is rethrown from run_pass().
 */

#include "tuscan/bounded_queue.hpp"
#include "tuscan/feature_encoder.hpp"
#include "tuscan/forest_model.hpp"
#include "tuscan/types.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <utility>
#include <variant>
#include <vector>

namespace tuscan {

enum class PassState {
    FILLING,    // Producer pushing candidates
    DRAINING,   // All end-of-stream markers queued, workers finishing
    DONE,       // Every worker reported completion
    ABORTED     // A thread failed; the pass was torn down
};

const char* pass_state_name(PassState state);

struct EndOfStream {};
using WorkItem = std::variant<Candidate, EndOfStream>;

struct ScoredBatch {
    std::vector<ScoredCandidate> records;
};
struct WorkerDone {
    size_t worker_id;
};
using ResultItem = std::variant<ScoredBatch, WorkerDone>;

struct PipelineConfig {
    size_t num_workers = 1;
    size_t batch_size = DEFAULT_BATCH_SIZE;
};

struct PassStats {
    PassState state = PassState::FILLING;
    size_t candidates = 0;      // Pushed by the producer
    size_t batches = 0;         // Model invocations
    size_t records = 0;         // Delivered to the sink
    size_t workers_done = 0;
};

/**
 * Fan-in side of the pipeline: drains the result queue into the sink and
 * counts WorkerDone markers.
 */
class ResultCollector {
public:
    using RecordSink = std::function<void(const ScoredCandidate&)>;

    ResultCollector(BoundedQueue<ResultItem>& results, size_t num_workers, RecordSink sink)
        : results_(results), num_workers_(num_workers), sink_(std::move(sink)) {}

    // Returns true when all workers reported done, false when the queue was closed first
    bool run();

    size_t workers_done() const { return workers_done_; }
    size_t batches() const { return batches_; }
    size_t records() const { return records_; }

private:
    BoundedQueue<ResultItem>& results_;
    size_t num_workers_;
    RecordSink sink_;
    size_t workers_done_ = 0;
    size_t batches_ = 0;
    size_t records_ = 0;
};

class ScoringPipeline {
public:
    // Push one candidate; returns false when the pass was aborted
    using CandidateSink = std::function<bool(Candidate&&)>;
    using CandidateSource = std::function<void(const CandidateSink&)>;
    using RecordSink = ResultCollector::RecordSink;

    /**
     * The model and encoder are borrowed read-only for the pipeline's lifetime.
     * Throws ModelError when the model's feature count does not match the encoder.
     */
    ScoringPipeline(const ScoringModel& model, const FeatureEncoder& encoder,
                    PipelineConfig config);

    /**
     * Run one strand pass to completion. Threads are created and joined
     * inside this call.
     */
    PassStats run_pass(const CandidateSource& source, const Region& region,
                       const RecordSink& sink) const;

    /**
     * Encode + predict one batch and attach coordinates.
     * Throws ModelError when the model returns the wrong number of scores.
     */
    void score_batch(const std::vector<Candidate>& batch, const Region& region,
                     FeatureMatrix& matrix, std::vector<ScoredCandidate>& out) const;

    const PipelineConfig& config() const { return config_; }

private:
    void worker_loop(size_t worker_id, const Region& region,
                     BoundedQueue<WorkItem>& work,
                     BoundedQueue<ResultItem>& results) const;

    const ScoringModel& model_;
    const FeatureEncoder& encoder_;
    PipelineConfig config_;
};

}  // namespace tuscan
