#include "args.hpp"
#include "tuscan/version.h"
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace tuscan {
namespace cli {

namespace {

struct ArgCursor {
    int argc;
    char** argv;
    int i = 1;

    std::string require_value(const std::string& flag) {
        if (i + 1 >= argc) {
            throw ParseArgsExit(1, "Error: Missing value for " + flag);
        }
        return argv[++i];
    }
};

size_t parse_size(const std::string& flag, const std::string& value) {
    try {
        size_t idx = 0;
        if (!value.empty() && value[0] == '-') {
            throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
        }
        size_t parsed = std::stoull(value, &idx);
        if (idx != value.size()) {
            throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
        }
        return parsed;
    } catch (const ParseArgsExit&) {
        throw;
    } catch (const std::exception&) {
        throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
    }
}

int parse_int(const std::string& flag, const std::string& value) {
    try {
        size_t idx = 0;
        int parsed = std::stoi(value, &idx);
        if (idx != value.size()) {
            throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
        }
        return parsed;
    } catch (const ParseArgsExit&) {
        throw;
    } catch (const std::exception&) {
        throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
    }
}

float parse_float(const std::string& flag, const std::string& value) {
    try {
        size_t idx = 0;
        float parsed = std::stof(value, &idx);
        if (idx != value.size()) {
            throw ParseArgsExit(1, "Error: Invalid number for " + flag + ": " + value);
        }
        return parsed;
    } catch (const ParseArgsExit&) {
        throw;
    } catch (const std::exception&) {
        throw ParseArgsExit(1, "Error: Invalid number for " + flag + ": " + value);
    }
}

ScoringMode parse_mode(const std::string& value) {
    ScoringMode mode;
    if (!parse_scoring_mode(value, mode)) {
        throw ParseArgsExit(1, "Error: Unknown mode '" + value +
                               "'. Use Regression or Classification.");
    }
    return mode;
}

}  // namespace

void print_version() {
    std::cout << "tuscan " << TUSCAN_VERSION << "\n";
}

void print_scan_usage(const char* program_name) {
    std::cout << "TUSCAN v" << TUSCAN_VERSION << "\n\n";
    std::cout << "Usage: " << program_name << " scan -m <mode> (-i <fasta> | -g <genome> -l <loc> | -g <genome> -r <bed>) [options]\n\n";
    std::cout << "Scan both strands for [ACGT]{25}GG[ACGT]{3} sites and score every candidate.\n\n";
    std::cout << "Input:\n";
    std::cout << "  -i, --input <file>       FASTA (or .gz); every record is scanned\n";
    std::cout << "  -g, --genome <file>      Genome FASTA to cut regions from\n";
    std::cout << "  -l, --location <loc>     Region chr:start-end (1-based, inclusive)\n";
    std::cout << "  -r, --regions <file>     BED file of regions\n";
    std::cout << "\nScoring:\n";
    std::cout << "  -m, --mode <mode>        Regression or Classification (required)\n";
    std::cout << "  --model <file>           Forest model (default: $TUSCAN_MODEL_DIR/rf_<mode>.forest)\n";
    std::cout << "  --batch-size <int>       Candidates per model call (default: " << DEFAULT_BATCH_SIZE << ")\n";
    std::cout << "  --min-score <float>      Only report sites scoring at least this\n";
    std::cout << "\nOutput:\n";
    std::cout << "  -o, --output <file>      Report file, '-' for stdout (default: " << DEFAULT_REPORT_NAME << ")\n";
    std::cout << "\n";
    std::cout << "  -t, --threads <int>      Scoring workers (default: $TUSCAN_THREADS or auto)\n";
    std::cout << "  -v, --verbose            Verbose output\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " scan -m Regression -i contigs.fa.gz -o sites.txt\n";
    std::cout << "  " << program_name << " scan -m Classification -g hg38.fa -l chr1:10000-20000\n";
}

void print_guide_usage(const char* program_name, bool features_only) {
    const char* cmd = features_only ? "features" : "score";
    std::cout << "TUSCAN v" << TUSCAN_VERSION << "\n\n";
    std::cout << "Usage: " << program_name << " " << cmd << " -m <mode> -i <input> [options]\n\n";
    if (features_only) {
        std::cout << "Write the feature matrix of pre-cut 30-mers (header + one row per sequence).\n\n";
    } else {
        std::cout << "Score pre-cut 30-mers (25 nt, GG PAM, 3 nt).\n\n";
    }
    std::cout << "Options:\n";
    std::cout << "  -i, --input <file>       One 30-mer per line, or FASTA\n";
    std::cout << "  -m, --mode <mode>        Regression or Classification (required)\n";
    if (!features_only) {
        std::cout << "  --model <file>           Forest model (default: $TUSCAN_MODEL_DIR/rf_<mode>.forest)\n";
    }
    std::cout << "  -o, --output <file>      Output file, '-' for stdout (default: " << DEFAULT_REPORT_NAME << ")\n";
    std::cout << "  -t, --threads <int>      Number of threads (default: auto)\n";
    std::cout << "  -v, --verbose            Verbose output\n";
    std::cout << "  -h, --help               Show this help message\n";
}

ScanOptions parse_scan_args(int argc, char* argv[]) {
    ScanOptions opts;
    ArgCursor cur{argc, argv};

    for (; cur.i < argc; ++cur.i) {
        std::string arg = argv[cur.i];

        if (arg == "-h" || arg == "--help") {
            print_scan_usage("tuscan");
            throw ParseArgsExit(0);
        } else if (arg == "-i" || arg == "--input") {
            opts.input_fasta = cur.require_value(arg);
        } else if (arg == "-g" || arg == "--genome") {
            opts.genome_fasta = cur.require_value(arg);
        } else if (arg == "-l" || arg == "--location") {
            opts.location = cur.require_value(arg);
        } else if (arg == "-r" || arg == "--regions") {
            opts.bed_file = cur.require_value(arg);
        } else if (arg == "-m" || arg == "--mode") {
            opts.mode = parse_mode(cur.require_value(arg));
            opts.mode_set = true;
        } else if (arg == "--model") {
            opts.model_file = cur.require_value(arg);
        } else if (arg == "-o" || arg == "--output") {
            opts.output_file = cur.require_value(arg);
        } else if (arg == "-t" || arg == "--threads") {
            opts.num_threads = parse_int(arg, cur.require_value(arg));
            if (opts.num_threads < 1) {
                throw ParseArgsExit(1, "Error: --threads must be >= 1");
            }
        } else if (arg == "--batch-size") {
            opts.batch_size = parse_size(arg, cur.require_value(arg));
            if (opts.batch_size < 1) {
                throw ParseArgsExit(1, "Error: --batch-size must be >= 1");
            }
        } else if (arg == "--min-score") {
            opts.min_score = parse_float(arg, cur.require_value(arg));
            opts.has_min_score = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        }
    }

    if (!opts.mode_set) {
        throw ParseArgsExit(1, "Error: No mode specified (-m Regression|Classification)");
    }
    if (!opts.input_fasta.empty() && !opts.genome_fasta.empty()) {
        throw ParseArgsExit(1, "Error: -i and -g are mutually exclusive");
    }
    if (opts.input_fasta.empty() && opts.genome_fasta.empty()) {
        throw ParseArgsExit(1, "Error: No input specified (-i <fasta> or -g <genome>)");
    }
    if (!opts.input_fasta.empty() && (!opts.location.empty() || !opts.bed_file.empty())) {
        throw ParseArgsExit(1, "Error: -l/-r require -g <genome>, not -i");
    }
    if (!opts.genome_fasta.empty()) {
        if (opts.location.empty() == opts.bed_file.empty()) {
            throw ParseArgsExit(1, "Error: -g requires exactly one of -l <loc> or -r <bed>");
        }
    }

    return opts;
}

GuideOptions parse_guide_args(int argc, char* argv[], bool features_only) {
    GuideOptions opts;
    ArgCursor cur{argc, argv};

    for (; cur.i < argc; ++cur.i) {
        std::string arg = argv[cur.i];

        if (arg == "-h" || arg == "--help") {
            print_guide_usage("tuscan", features_only);
            throw ParseArgsExit(0);
        } else if (arg == "-i" || arg == "--input") {
            opts.input_file = cur.require_value(arg);
        } else if (arg == "-m" || arg == "--mode") {
            opts.mode = parse_mode(cur.require_value(arg));
            opts.mode_set = true;
        } else if (arg == "--model" && !features_only) {
            opts.model_file = cur.require_value(arg);
        } else if (arg == "-o" || arg == "--output") {
            opts.output_file = cur.require_value(arg);
        } else if (arg == "-t" || arg == "--threads") {
            opts.num_threads = parse_int(arg, cur.require_value(arg));
            if (opts.num_threads < 1) {
                throw ParseArgsExit(1, "Error: --threads must be >= 1");
            }
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        }
    }

    if (!opts.mode_set) {
        throw ParseArgsExit(1, "Error: No mode specified (-m Regression|Classification)");
    }
    if (opts.input_file.empty()) {
        throw ParseArgsExit(1, "Error: No input file specified");
    }

    return opts;
}

int resolve_num_threads(int requested) {
    int n = requested;
    if (n <= 0) {
        if (const char* env = std::getenv("TUSCAN_THREADS")) {
            try {
                n = std::stoi(env);
            } catch (const std::exception&) {
                std::cerr << "Warning: ignoring invalid TUSCAN_THREADS='" << env << "'\n";
                n = 0;
            }
        }
    }
#ifdef _OPENMP
    if (n <= 0) n = omp_get_max_threads();
#endif
    if (n <= 0) n = static_cast<int>(std::thread::hardware_concurrency());
    if (n <= 0) n = 4;
#ifdef _OPENMP
    omp_set_num_threads(n);
#endif
    return n;
}

}  // namespace cli
}  // namespace tuscan
