// tuscan scan: genome-wide site discovery and scoring
//
// Usage: tuscan scan -m <mode> (-i <fasta> | -g <genome> (-l <loc> | -r <bed>)) [options]
//
// Each target is scanned forward, then as its reverse complement. Candidates
// flow through the scoring pipeline and every scored site is written to the
// report as it arrives.

#include "subcommand.hpp"
#include "args.hpp"
#include "tuscan/feature_encoder.hpp"
#include "tuscan/forest_model.hpp"
#include "tuscan/log_utils.hpp"
#include "tuscan/orchestrator.hpp"
#include "tuscan/region_io.hpp"
#include "tuscan/report_writer.hpp"
#include "tuscan/scoring_pipeline.hpp"
#include "tuscan/version.h"
#include <chrono>
#include <iostream>
#include <vector>

namespace tuscan {
namespace cli {

namespace {

std::vector<Region> requested_regions(const ScanOptions& opts) {
    if (!opts.location.empty()) {
        return {parse_location(opts.location)};
    }
    return read_bed(opts.bed_file);
}

}  // namespace

int cmd_scan(int argc, char* argv[]) {
    auto run_start = std::chrono::steady_clock::now();

    ScanOptions opts;
    try {
        opts = parse_scan_args(argc, argv);
    } catch (const ParseArgsExit& e) {
        if (e.what()[0] != '\0') {
            std::cerr << e.what() << "\n";
            std::cerr << "Run 'tuscan scan --help' for usage.\n";
        }
        return e.exit_code();
    }

    const int num_threads = resolve_num_threads(opts.num_threads);
    const std::string model_path =
        opts.model_file.empty() ? default_model_path(opts.mode) : opts.model_file;

    std::cerr << "TUSCAN v" << TUSCAN_VERSION << "\n";
    if (!opts.input_fasta.empty()) {
        std::cerr << "Input: " << opts.input_fasta << "\n";
    } else {
        std::cerr << "Genome: " << opts.genome_fasta << "\n";
        std::cerr << "Regions: " << (opts.location.empty() ? opts.bed_file : opts.location) << "\n";
    }
    std::cerr << "Output: " << (opts.output_file == "-" ? "stdout" : opts.output_file) << "\n";
    std::cerr << "Mode: " << scoring_mode_name(opts.mode) << "\n";
    std::cerr << "Model: " << model_path << "\n";
    std::cerr << "Threads: " << num_threads << "\n";
    if (opts.verbose) {
        std::cerr << "Batch size: " << log_utils::format_count(opts.batch_size) << "\n";
        if (opts.has_min_score) {
            std::cerr << "Min score: " << opts.min_score << "\n";
        }
    }
    std::cerr << "\n";

    try {
        auto load_start = std::chrono::steady_clock::now();
        ForestModel model = ForestModel::load(model_path);
        if (model.mode() != opts.mode) {
            throw ModelError(model_path + ": model was trained for " +
                             scoring_mode_name(model.mode()) + ", not " +
                             scoring_mode_name(opts.mode));
        }
        if (opts.verbose) {
            std::cerr << "Loaded " << model.num_trees() << " trees, "
                      << model.num_features() << " features ("
                      << log_utils::format_elapsed(load_start, std::chrono::steady_clock::now())
                      << ")\n";
        }

        FeatureEncoder encoder(opts.mode);
        PipelineConfig config;
        config.num_workers = static_cast<size_t>(num_threads);
        config.batch_size = opts.batch_size;
        ScoringPipeline pipeline(model, encoder, config);
        Orchestrator orchestrator(pipeline, opts.verbose);

        ReportWriter report(opts.output_file, ReportWriter::Layout::SCAN);
        report.write_header();

        auto sink = [&report, &opts](const ScoredCandidate& site) {
            if (opts.has_min_score && site.score < opts.min_score) return;
            report.write_site(site);
        };

        size_t total_targets = 0;
        uint64_t total_bp = 0;
        size_t total_candidates = 0;
        size_t total_scored = 0;

        auto scan_target = [&](const ScanTarget& target) {
            TargetStats stats = orchestrator.run(target, sink);
            ++total_targets;
            total_bp += target.sequence.size();
            total_candidates += stats.candidates();
            total_scored += stats.records();
        };

        if (!opts.input_fasta.empty()) {
            for_each_fasta_target(opts.input_fasta, [&](ScanTarget&& target) {
                scan_target(target);
            });
        } else {
            const std::vector<Region> regions = requested_regions(opts);
            if (opts.verbose) {
                std::cerr << "Fetching " << regions.size() << " region(s) from "
                          << opts.genome_fasta << "\n";
            }
            for (const auto& target : fetch_regions(opts.genome_fasta, regions)) {
                scan_target(target);
            }
        }

        report.close();

        auto run_end = std::chrono::steady_clock::now();
        std::cerr << "Targets: " << log_utils::format_count(total_targets)
                  << " (" << log_utils::format_count(total_bp) << " bp)\n";
        std::cerr << "Candidates scored: " << log_utils::format_count(total_scored)
                  << " of " << log_utils::format_count(total_candidates) << "\n";
        std::cerr << "Sites reported: " << log_utils::format_count(report.rows_written()) << "\n";
        std::cerr << "Runtime: " << log_utils::format_elapsed(run_start, run_end) << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

namespace {
const SubcommandRegistrar scan_registrar("scan", "Find and score Cas9 sites on both strands of a sequence", cmd_scan, 10);
}

}  // namespace cli
}  // namespace tuscan
