// SwapTrade ledger command-line tool: audit and batch replay

#include "commands.hpp"

#include "swaptrade/codec.hpp"
#include "swaptrade/config.hpp"
#include "swaptrade/dispatcher.hpp"
#include "swaptrade/invariants.hpp"
#include "swaptrade/log.hpp"
#include "swaptrade/store.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace swaptrade {
namespace cli {

using json = nlohmann::json;

namespace {

//------------------------------------------------------------------------------
// Helpers
//------------------------------------------------------------------------------

std::string read_file(const std::string& path) {
    std::ifstream file{path, std::ios::binary};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

json report_json(const InvariantReport& report) {
    json out = {
        {"invariant", invariant_name(report.id)},
        {"holds", report.holds},
    };
    if (report.id == InvariantId::CONSERVATION || report.id == InvariantId::LP_CONSERVATION) {
        out["computed"] = to_string(report.computed);
        out["expected"] = to_string(report.expected);
    }
    if (!report.holds) out["diagnostic"] = report.diagnostic;
    return out;
}

json result_json(const BatchOperation& op, const OperationResult& result) {
    json out = {
        {"op", op_name(op.op)},
        {"status", error_name(result.status)},
        {"phase", phase_name(result.phase)},
        {"amount0", to_string(result.amount0)},
        {"amount1", to_string(result.amount1)},
    };
    if (result.failed_at) out["failed_at"] = phase_name(*result.failed_at);
    if (!result.diagnostic.empty()) out["diagnostic"] = result.diagnostic;
    return out;
}

} // anonymous namespace

//------------------------------------------------------------------------------
// Commands
//------------------------------------------------------------------------------

int run_audit(const Options& opts, std::ostream& out, std::ostream& err) {
    if (opts.state_path.empty()) {
        err << "Usage: swaptrade-cli audit --state <file>\n";
        return 1;
    }

    LedgerState state;
    int32_t status = decode_state(read_file(opts.state_path), state);
    if (status != errors::OK) {
        err << "Cannot decode " << opts.state_path << ": " << error_name(status) << "\n";
        return 1;
    }

    bool all_hold = true;
    json reports = json::array();
    for (const auto& report : invariants::audit(state)) {
        all_hold = all_hold && report.holds;
        reports.push_back(report_json(report));
    }
    out << json{{"holds", all_hold}, {"reports", reports}}.dump(2) << "\n";
    return all_hold ? 0 : 2;
}

int run_batch(const Options& opts, std::ostream& out, std::ostream& err) {
    if (opts.config_path.empty() || opts.state_path.empty() || opts.ops_path.empty()) {
        err << "Usage: swaptrade-cli run --config <file> --state <file> --ops <file>"
               " [--best-effort]\n";
        return 1;
    }

    LedgerConfig config = LedgerConfig::from_file(opts.config_path);
    if (!set_log_level(opts.verbose ? "debug" : config.log_level)) {
        err << "Unknown log level: " << config.log_level << "\n";
        return 1;
    }

    OperationDispatcher dispatcher(config);
    FileStateStore store(opts.state_path);
    int32_t status = dispatcher.load(store);
    if (status != errors::OK) {
        err << "Cannot load " << opts.state_path << ": " << error_name(status) << "\n";
        return 1;
    }

    std::vector<BatchOperation> ops;
    status = decode_batch(read_file(opts.ops_path), dispatcher.admin(), ops);
    if (status != errors::OK) {
        err << "Cannot decode " << opts.ops_path << ": " << error_name(status) << "\n";
        return 1;
    }

    BatchMode mode = opts.best_effort ? BatchMode::BEST_EFFORT : BatchMode::ATOMIC;
    BatchResult batch = dispatcher.execute_batch(ops, mode);

    json results = json::array();
    for (size_t i = 0; i < batch.results.size(); ++i) {
        results.push_back(result_json(ops[i], batch.results[i]));
    }
    out << json{
        {"status", error_name(batch.status)},
        {"mode", opts.best_effort ? "best-effort" : "atomic"},
        {"committed", batch.committed},
        {"halted", dispatcher.is_halted()},
        {"results", results},
    }.dump(2) << "\n";

    // A halt is persisted so the next run starts halted too
    if (batch.status == errors::OK || dispatcher.is_halted()) {
        dispatcher.store(store);
    }
    return batch.status == errors::OK ? 0 : 2;
}

} // namespace cli
} // namespace swaptrade
