// tuscan score: score pre-cut 30-mers
//
// Usage: tuscan score -m <mode> -i <input> [-o output] [--model file] [-t N] [-v]
//
// Input is one 30-mer per line or FASTA. Invalid lines are reported and
// skipped; reverse-oriented sites are flipped and reported with Dir '-'.

#include "subcommand.hpp"
#include "args.hpp"
#include "tuscan/feature_encoder.hpp"
#include "tuscan/forest_model.hpp"
#include "tuscan/guide_reader.hpp"
#include "tuscan/log_utils.hpp"
#include "tuscan/report_writer.hpp"
#include "tuscan/version.h"
#include <chrono>
#include <iostream>
#include <vector>

namespace tuscan {
namespace cli {

int cmd_score(int argc, char* argv[]) {
    auto run_start = std::chrono::steady_clock::now();

    GuideOptions opts;
    try {
        opts = parse_guide_args(argc, argv, false);
    } catch (const ParseArgsExit& e) {
        if (e.what()[0] != '\0') {
            std::cerr << e.what() << "\n";
            std::cerr << "Run 'tuscan score --help' for usage.\n";
        }
        return e.exit_code();
    }

    const int num_threads = resolve_num_threads(opts.num_threads);
    const std::string model_path =
        opts.model_file.empty() ? default_model_path(opts.mode) : opts.model_file;

    if (opts.verbose) {
        std::cerr << "TUSCAN v" << TUSCAN_VERSION << "\n";
        std::cerr << "Input: " << opts.input_file << "\n";
        std::cerr << "Mode: " << scoring_mode_name(opts.mode) << "\n";
        std::cerr << "Model: " << model_path << "\n";
        std::cerr << "Threads: " << num_threads << "\n\n";
    }

    try {
        ForestModel model = ForestModel::load(model_path);
        if (model.mode() != opts.mode) {
            throw ModelError(model_path + ": model was trained for " +
                             scoring_mode_name(model.mode()) + ", not " +
                             scoring_mode_name(opts.mode));
        }
        FeatureEncoder encoder(opts.mode);
        if (model.num_features() != encoder.num_features()) {
            throw ModelError(model_path + ": model expects " + std::to_string(model.num_features()) +
                             " features, encoder produces " + std::to_string(encoder.num_features()));
        }

        size_t rejected = 0;
        std::vector<GuideRecord> guides = read_guides(opts.input_file, [&rejected](GuideCheck check, const std::string& msg) {
                std::cerr << "Warning: " << msg << "\n";
                if (check != GuideCheck::OK) ++rejected;
            });

        FeatureMatrix matrix(guides.size(), encoder.num_features());
        const int64_t n = static_cast<int64_t>(guides.size());
        #pragma omp parallel for schedule(static)
        for (int64_t i = 0; i < n; ++i) {
            const size_t r = static_cast<size_t>(i);
            encoder.encode(guide_window(guides[r]), matrix.row(r));
        }

        std::vector<float> scores = model.predict(matrix);
        if (scores.size() != guides.size()) {
            throw ModelError("Model returned " + std::to_string(scores.size()) +
                             " scores for " + std::to_string(guides.size()) + " sequences");
        }

        ReportWriter report(opts.output_file, ReportWriter::Layout::SEQUENCES);
        report.write_header();
        for (size_t i = 0; i < guides.size(); ++i) {
            report.write_sequence(guides[i].id, guides[i].sequence, scores[i], guides[i].dir);
        }
        report.close();

        if (opts.verbose) {
            auto run_end = std::chrono::steady_clock::now();
            std::cerr << "Scored: " << log_utils::format_count(guides.size())
                      << ", rejected: " << log_utils::format_count(rejected) << "\n";
            std::cerr << "Runtime: " << log_utils::format_elapsed(run_start, run_end) << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

namespace {
const SubcommandRegistrar score_registrar("score", "Score pre-cut 30-mer sites", cmd_score, 20);
}

}  // namespace cli
}  // namespace tuscan
