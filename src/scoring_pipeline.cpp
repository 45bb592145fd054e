#include "tuscan/scoring_pipeline.hpp"

#include <exception>
#include <mutex>
#include <thread>

namespace tuscan {

const char* pass_state_name(PassState state) {
    switch (state) {
        case PassState::FILLING: return "FILLING";
        case PassState::DRAINING: return "DRAINING";
        case PassState::DONE: return "DONE";
        case PassState::ABORTED: return "ABORTED";
    }
    return "UNKNOWN";
}

bool ResultCollector::run() {
    while (workers_done_ < num_workers_) {
        ResultItem item;
        if (!results_.pop(item)) return false;

        if (std::holds_alternative<WorkerDone>(item)) {
            ++workers_done_;
            continue;
        }
        const auto& batch = std::get<ScoredBatch>(item);
        ++batches_;
        for (const auto& rec : batch.records) {
            sink_(rec);
            ++records_;
        }
    }
    return true;
}

ScoringPipeline::ScoringPipeline(const ScoringModel& model, const FeatureEncoder& encoder,
                                 PipelineConfig config)
    : model_(model), encoder_(encoder), config_(config) {
    if (config_.num_workers == 0) config_.num_workers = 1;
    if (config_.batch_size == 0) config_.batch_size = DEFAULT_BATCH_SIZE;
    if (model_.num_features() != encoder_.num_features()) {
        throw ModelError("Model expects " + std::to_string(model_.num_features()) +
                         " features but " + scoring_mode_name(encoder_.mode()) +
                         " encoding produces " + std::to_string(encoder_.num_features()));
    }
}

void ScoringPipeline::score_batch(const std::vector<Candidate>& batch, const Region& region,
                                  FeatureMatrix& matrix,
                                  std::vector<ScoredCandidate>& out) const {
    encoder_.encode_batch(batch, matrix);
    const std::vector<float> scores = model_.predict(matrix);
    if (scores.size() != batch.size()) {
        throw ModelError("Model returned " + std::to_string(scores.size()) +
                         " scores for a batch of " + std::to_string(batch.size()));
    }

    out.clear();
    out.reserve(batch.size());
    for (size_t i = 0; i < batch.size(); ++i) {
        const Candidate& c = batch[i];
        const SiteSpan span = site_span(region, c.offset, c.strand);
        ScoredCandidate rec;
        rec.chrom = region.chrom;
        rec.start = span.start;
        rec.end = span.end;
        rec.strand = c.strand;
        rec.window = c.window;
        rec.score = scores[i];
        out.push_back(std::move(rec));
    }
}

void ScoringPipeline::worker_loop(size_t worker_id, const Region& region,
                                  BoundedQueue<WorkItem>& work,
                                  BoundedQueue<ResultItem>& results) const {
    std::vector<Candidate> batch;
    batch.reserve(config_.batch_size);
    FeatureMatrix matrix;

    auto flush = [&]() -> bool {
        if (batch.empty()) return true;
        ScoredBatch scored;
        score_batch(batch, region, matrix, scored.records);
        batch.clear();
        return results.push(ResultItem(std::move(scored)));
    };

    while (true) {
        WorkItem item;
        if (!work.pop(item)) return;  // aborted

        if (std::holds_alternative<EndOfStream>(item)) {
            // A failed push means the pass is already aborting
            if (flush()) results.push(ResultItem(WorkerDone{worker_id}));
            return;
        }

        batch.push_back(std::move(std::get<Candidate>(item)));
        if (batch.size() >= config_.batch_size) {
            if (!flush()) return;
        }
    }
}

PassStats ScoringPipeline::run_pass(const CandidateSource& source, const Region& region,
                                    const RecordSink& sink) const {
    const size_t worker_count = config_.num_workers;
    const size_t capacity = worker_count * 2;

    BoundedQueue<WorkItem> work(capacity);
    BoundedQueue<ResultItem> results(capacity);

    std::atomic<PassState> state{PassState::FILLING};
    std::atomic<size_t> produced{0};

    std::exception_ptr pipeline_error = nullptr;
    std::mutex error_mutex;
    auto set_pipeline_error = [&](std::exception_ptr ep) {
        {
            std::lock_guard<std::mutex> lock(error_mutex);
            if (!pipeline_error) pipeline_error = ep;
        }
        state.store(PassState::ABORTED);
        work.close();
        results.close();
    };

    std::thread producer;
    std::vector<std::thread> workers;
    workers.reserve(worker_count);

    auto join_all = [&]() {
        if (producer.joinable()) producer.join();
        for (auto& w : workers) {
            if (w.joinable()) w.join();
        }
    };

    ResultCollector collector(results, worker_count, sink);

    try {
        producer = std::thread([&] {
            try {
                source([&](Candidate&& c) {
                    if (!work.push(WorkItem(std::move(c)))) return false;
                    produced.fetch_add(1, std::memory_order_relaxed);
                    return true;
                });
                PassState expected = PassState::FILLING;
                state.compare_exchange_strong(expected, PassState::DRAINING);
                for (size_t i = 0; i < worker_count; ++i) {
                    if (!work.push(WorkItem(EndOfStream{}))) break;
                }
            } catch (...) {
                set_pipeline_error(std::current_exception());
            }
        });

        for (size_t wi = 0; wi < worker_count; ++wi) {
            workers.emplace_back([&, wi] {
                try {
                    worker_loop(wi, region, work, results);
                } catch (...) {
                    set_pipeline_error(std::current_exception());
                }
            });
        }

        if (collector.run()) {
            PassState expected = PassState::DRAINING;
            state.compare_exchange_strong(expected, PassState::DONE);
        }
    } catch (...) {
        // Thread creation failure or a sink exception on the collector thread
        set_pipeline_error(std::current_exception());
    }

    join_all();

    if (pipeline_error) std::rethrow_exception(pipeline_error);

    PassStats stats;
    stats.state = state.load();
    stats.candidates = produced.load();
    stats.batches = collector.batches();
    stats.records = collector.records();
    stats.workers_done = collector.workers_done();
    return stats;
}

}  // namespace tuscan
