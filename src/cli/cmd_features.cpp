// tuscan features: dump the feature matrix of pre-cut 30-mers
//
// Usage: tuscan features -m <mode> -i <input> [-o output]
//
// Space-separated; header "Name" followed by the feature column names, then
// one row per valid input sequence.

#include "subcommand.hpp"
#include "args.hpp"
#include "tuscan/feature_encoder.hpp"
#include "tuscan/guide_reader.hpp"
#include "tuscan/log_utils.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace tuscan {
namespace cli {

namespace {

void write_matrix(std::ostream& out, const FeatureEncoder& encoder,
                  const std::vector<GuideRecord>& guides) {
    out << "Name";
    for (const auto& name : encoder.feature_names()) {
        out << ' ' << name;
    }
    out << '\n';

    std::vector<float> row(encoder.num_features());
    char buf[32];
    for (const auto& g : guides) {
        encoder.encode(guide_window(g), row.data());
        out << g.id;
        for (float v : row) {
            std::snprintf(buf, sizeof(buf), " %g", static_cast<double>(v));
            out << buf;
        }
        out << '\n';
    }
}

}  // namespace

int cmd_features(int argc, char* argv[]) {
    GuideOptions opts;
    try {
        opts = parse_guide_args(argc, argv, true);
    } catch (const ParseArgsExit& e) {
        if (e.what()[0] != '\0') {
            std::cerr << e.what() << "\n";
            std::cerr << "Run 'tuscan features --help' for usage.\n";
        }
        return e.exit_code();
    }

    try {
        FeatureEncoder encoder(opts.mode);
        std::vector<GuideRecord> guides = read_guides(opts.input_file, [](GuideCheck, const std::string& msg) {
            std::cerr << "Warning: " << msg << "\n";
        });

        if (opts.output_file == "-") {
            write_matrix(std::cout, encoder, guides);
            std::cout.flush();
            if (!std::cout) throw std::runtime_error("Failed writing to stdout");
        } else {
            std::ofstream out(opts.output_file);
            if (!out) {
                throw std::runtime_error("Failed to open file: " + opts.output_file);
            }
            write_matrix(out, encoder, guides);
            out.close();
            if (out.fail()) {
                throw std::runtime_error("Failed writing " + opts.output_file);
            }
        }

        if (opts.verbose) {
            std::cerr << "Wrote " << log_utils::format_count(guides.size()) << " rows x "
                      << encoder.num_features() << " features ("
                      << scoring_mode_name(opts.mode) << ")\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

namespace {
const SubcommandRegistrar features_registrar("features", "Write the feature matrix of pre-cut 30-mers", cmd_features, 30);
}

}  // namespace cli
}  // namespace tuscan
