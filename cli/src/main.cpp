// SwapTrade ledger command-line tool
//
// Audits a stored state blob or replays a batch of operations against it.

#include "commands.hpp"
#include "swaptrade/log.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace swaptrade;
using cli::Options;

//------------------------------------------------------------------------------
// Arguments
//------------------------------------------------------------------------------

void print_usage(const char* prog) {
    std::cout << "SwapTrade ledger tool\n\n"
              << "Usage: " << prog << " <command> [options]\n\n"
              << "Commands:\n"
              << "  audit   Check every state-only invariant of a stored state\n"
              << "  run     Replay a JSON batch of operations and store the result\n\n"
              << "Options:\n"
              << "  -c, --config <file>  Ledger configuration (JSON)\n"
              << "  -s, --state <file>   State blob (created on first run)\n"
              << "  -o, --ops <file>     Batch of operations (JSON array)\n"
              << "  -b, --best-effort    Commit operations independently\n"
              << "  -v, --verbose        Debug logging\n"
              << "  -h, --help           Show this help message\n\n"
              << "Examples:\n"
              << "  " << prog << " audit --state ledger.json\n"
              << "  " << prog << " run -c config.json -s ledger.json -o ops.json\n";
}

Options parse_args(int argc, char* argv[]) {
    Options opts;

    auto value = [&](int& i, const char* what) -> std::string {
        if (i + 1 >= argc) {
            std::cerr << "Missing " << what << " argument\n";
            std::exit(1);
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            opts.config_path = value(i, "config");
        } else if (arg == "-s" || arg == "--state") {
            opts.state_path = value(i, "state");
        } else if (arg == "-o" || arg == "--ops") {
            opts.ops_path = value(i, "ops");
        } else if (arg == "-b" || arg == "--best-effort") {
            opts.best_effort = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg[0] != '-' && opts.command.empty()) {
            opts.command = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
    }

    return opts;
}

int main(int argc, char* argv[]) {
    Options opts = parse_args(argc, argv);
    if (opts.verbose && !set_log_level("debug")) {
        return 1;
    }

    try {
        if (opts.command == "audit") {
            return cli::run_audit(opts, std::cout, std::cerr);
        } else if (opts.command == "run") {
            return cli::run_batch(opts, std::cout, std::cerr);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (opts.command.empty()) {
        print_usage(argv[0]);
    } else {
        std::cerr << "Unknown command: " << opts.command << "\n";
    }
    return 1;
}
