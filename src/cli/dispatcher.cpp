// tuscan: subcommand dispatch
//
//   tuscan scan -m <mode> -i <fasta>              scan and score every record
//   tuscan scan -m <mode> -g <genome> -l <loc>    scan one genomic region
//   tuscan score -m <mode> -i <30mers>            score pre-cut sites
//   tuscan features -m <mode> -i <30mers>         dump the feature matrix

#include "subcommand.hpp"
#include "args.hpp"
#include <exception>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    using tuscan::cli::SubcommandRegistry;
    const auto& registry = SubcommandRegistry::instance();

    if (argc < 2) {
        registry.print_help(std::cerr, argv[0]);
        return 1;
    }

    const std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        registry.print_help(std::cout, argv[0]);
        return 0;
    }
    if (command == "-V" || command == "--version") {
        tuscan::cli::print_version();
        return 0;
    }

    // "help <command>" is "<command> --help"
    if (command == "help") {
        if (argc < 3) {
            registry.print_help(std::cout, argv[0]);
            return 0;
        }
        const auto* target = registry.find(argv[2]);
        if (!target) {
            std::cerr << "Unknown command: " << argv[2] << "\n";
            return 1;
        }
        char help_flag[] = "--help";
        char* sub_argv[] = {argv[2], help_flag, nullptr};
        return target->run(2, sub_argv);
    }

    const auto* sub = registry.find(command);
    if (!sub) {
        std::cerr << "Unknown command: " << command << "\n";
        std::cerr << "Run '" << argv[0] << " --help' for usage information.\n";
        return 1;
    }

    try {
        return sub->run(argc - 1, argv + 1);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
