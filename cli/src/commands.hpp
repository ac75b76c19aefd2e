#ifndef SWAPTRADE_CLI_COMMANDS_HPP
#define SWAPTRADE_CLI_COMMANDS_HPP

#include <ostream>
#include <string>

namespace swaptrade {
namespace cli {

struct Options {
    std::string command;
    std::string config_path;
    std::string state_path;
    std::string ops_path;
    bool best_effort = false;
    bool verbose = false;
};

// Exit codes: 0 success, 1 usage or I/O error, 2 invariant failure or
// rejected batch. Both may throw std::runtime_error on unreadable files.

// Decodes the state blob and prints every state-only invariant report
int run_audit(const Options& opts, std::ostream& out, std::ostream& err);

// Replays the batch; the state file is rewritten only if the batch
// committed or the dispatcher halted
int run_batch(const Options& opts, std::ostream& out, std::ostream& err);

} // namespace cli
} // namespace swaptrade

#endif // SWAPTRADE_CLI_COMMANDS_HPP
