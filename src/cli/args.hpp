#ifndef TUSCAN_CLI_ARGS_HPP
#define TUSCAN_CLI_ARGS_HPP

#include "tuscan/report_writer.hpp"
#include "tuscan/types.hpp"
#include <cstddef>
#include <stdexcept>
#include <string>

namespace tuscan {
namespace cli {

// Thrown by the parsers instead of calling exit(); the subcommand prints
// the message (if any) and returns the code. Code 0 is --help/--version.
class ParseArgsExit : public std::runtime_error {
public:
    explicit ParseArgsExit(int code, const std::string& message = "")
        : std::runtime_error(message), exit_code_(code) {}

    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};

struct ScanOptions {
    std::string input_fasta;       // -i: scan every record
    std::string genome_fasta;      // -g: cut regions from this genome
    std::string location;          // -l chr:start-end (1-based)
    std::string bed_file;          // -r regions.bed
    std::string model_file;        // --model (default derived from mode)
    std::string output_file = DEFAULT_REPORT_NAME;
    ScoringMode mode = ScoringMode::REGRESSION;
    bool mode_set = false;
    int num_threads = 0;           // 0 = auto
    size_t batch_size = DEFAULT_BATCH_SIZE;
    bool has_min_score = false;
    float min_score = 0.0f;
    bool verbose = false;
};

// Options shared by `score` and `features` (pre-cut 30-mers)
struct GuideOptions {
    std::string input_file;
    std::string model_file;
    std::string output_file = DEFAULT_REPORT_NAME;
    ScoringMode mode = ScoringMode::REGRESSION;
    bool mode_set = false;
    int num_threads = 0;
    bool verbose = false;
};

void print_version();

void print_scan_usage(const char* program_name);
void print_guide_usage(const char* program_name, bool features_only);

// Parse `tuscan scan` arguments (argv[0] is the subcommand name).
// Throws ParseArgsExit(0) for --help, ParseArgsExit(1, msg) for errors.
ScanOptions parse_scan_args(int argc, char* argv[]);

// Parse `tuscan score` / `tuscan features` arguments
GuideOptions parse_guide_args(int argc, char* argv[], bool features_only);

// -t value, else $TUSCAN_THREADS, else OpenMP max threads, else hardware
// concurrency, else 4. Also sets the OpenMP thread count.
int resolve_num_threads(int requested);

}  // namespace cli
}  // namespace tuscan

#endif  // TUSCAN_CLI_ARGS_HPP
