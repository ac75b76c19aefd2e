// SwapTrade - CLI command tests (audit, batch replay)

#include <catch2/catch_test_macros.hpp>
#include "commands.hpp"
#include "swaptrade/codec.hpp"
#include "swaptrade/dispatcher.hpp"
#include "test_helpers.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

using namespace swaptrade;
using namespace fixtures;
using json = nlohmann::json;

namespace {

std::string temp_path(const std::string& name) {
    return (std::filesystem::temp_directory_path() / ("swaptrade-cli-" + name)).string();
}

void write_file(const std::string& path, const std::string& content) {
    std::ofstream file{path, std::ios::binary | std::ios::trunc};
    REQUIRE(file.is_open());
    file << content;
}

std::string read_file(const std::string& path) {
    std::ifstream file{path, std::ios::binary};
    REQUIRE(file.is_open());
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// Config, state and ops files under the temp directory, removed on exit
struct Workspace {
    cli::Options opts;
    std::ostringstream out;
    std::ostringstream err;

    Workspace() {
        opts.config_path = temp_path("config.json");
        opts.state_path = temp_path("state.json");
        opts.ops_path = temp_path("ops.json");
        cleanup();
        write_file(opts.config_path, json{{"admin", addresses::to_hex(ADMIN)}}.dump());
    }

    ~Workspace() { cleanup(); }

    void cleanup() {
        std::remove(opts.config_path.c_str());
        std::remove(opts.state_path.c_str());
        std::remove(opts.ops_path.c_str());
    }

    int run(const json& ops, bool best_effort = false) {
        write_file(opts.ops_path, ops.dump());
        opts.best_effort = best_effort;
        out.str({});
        return cli::run_batch(opts, out, err);
    }

    json printed() const { return json::parse(out.str()); }
};

json mint_op(const Address& to, const char* asset, const char* amount) {
    return {{"op", "mint"}, {"user", addresses::to_hex(to)}, {"asset", asset}, {"amount", amount}};
}

json swap_op(const Address& user, const char* amount) {
    return {{"op", "swap"}, {"user", addresses::to_hex(user)},
            {"from", "XLM"}, {"to", "USDC"}, {"amount", amount}};
}

} // namespace

// =============================================================================
// audit
// =============================================================================

TEST_CASE("audit exit code follows the invariants", "[cli]") {
    Workspace ws;
    REQUIRE(ws.run(json::array({mint_op(ALICE, "XLM", "1000")})) == 0);

    SECTION("Clean state") {
        REQUIRE(cli::run_audit(ws.opts, ws.out, ws.err) == 0);
    }

    SECTION("State that breaks conservation") {
        json doc = json::parse(read_file(ws.opts.state_path));
        doc["total_minted"] = "1001";
        write_file(ws.opts.state_path, doc.dump());

        std::ostringstream out;
        REQUIRE(cli::run_audit(ws.opts, out, ws.err) == 2);
        json report = json::parse(out.str());
        REQUIRE(report["holds"] == false);
        REQUIRE(report["reports"][0]["invariant"] == "Conservation");
        REQUIRE(report["reports"][0]["holds"] == false);
    }

    SECTION("Undecodable state") {
        write_file(ws.opts.state_path, "{}");
        REQUIRE(cli::run_audit(ws.opts, ws.out, ws.err) == 1);
    }

    SECTION("Missing --state") {
        ws.opts.state_path.clear();
        REQUIRE(cli::run_audit(ws.opts, ws.out, ws.err) == 1);
    }
}

// =============================================================================
// run
// =============================================================================

TEST_CASE("run stores the state only when the batch commits", "[cli]") {
    Workspace ws;

    SECTION("Committed batch writes the state file") {
        REQUIRE_FALSE(std::filesystem::exists(ws.opts.state_path));
        REQUIRE(ws.run(json::array({mint_op(ALICE, "XLM", "1000")})) == 0);
        REQUIRE(ws.printed()["committed"] == 1);

        LedgerState state;
        REQUIRE(decode_state(read_file(ws.opts.state_path), state) == errors::OK);
        REQUIRE(state.balances.read(ALICE, NATIVE_XLM) == 1000);
    }

    SECTION("Failed atomic batch leaves the file untouched") {
        REQUIRE(ws.run(json::array({mint_op(ALICE, "XLM", "1000")})) == 0);
        const std::string before = read_file(ws.opts.state_path);

        json ops = json::array({mint_op(BOB, "USDC", "50"), swap_op(ALICE, "5000")});
        REQUIRE(ws.run(ops) == 2);
        json printed = ws.printed();
        REQUIRE(printed["status"] == "InsufficientBalance");
        REQUIRE(printed["mode"] == "atomic");
        REQUIRE(printed["committed"] == 0);

        REQUIRE(read_file(ws.opts.state_path) == before);
    }

    SECTION("--best-effort keeps the operations that committed") {
        json ops = json::array({mint_op(BOB, "USDC", "50"), swap_op(ALICE, "5000")});
        REQUIRE(ws.run(ops, true) == 0);
        json printed = ws.printed();
        REQUIRE(printed["mode"] == "best-effort");
        REQUIRE(printed["committed"] == 1);
        REQUIRE(printed["results"][1]["status"] == "InsufficientBalance");

        LedgerState state;
        REQUIRE(decode_state(read_file(ws.opts.state_path), state) == errors::OK);
        REQUIRE(state.balances.read(BOB, USDC) == 50);
    }

    SECTION("State carries over between runs") {
        REQUIRE(ws.run(json::array({mint_op(LP, "XLM", "1000000"),
                                     mint_op(LP, "USDC", "1000000")})) == 0);
        json liquidity = {{"op", "add_liquidity"}, {"user", addresses::to_hex(LP)},
                          {"amount", "1000000"}, {"amount_b", "1000000"}};
        REQUIRE(ws.run(json::array({liquidity, mint_op(ALICE, "XLM", "1000")})) == 0);
        REQUIRE(ws.run(json::array({swap_op(ALICE, "1000")})) == 0);
        REQUIRE(ws.printed()["results"][0]["amount0"] == "997");
    }

    SECTION("Missing arguments") {
        ws.opts.ops_path.clear();
        REQUIRE(cli::run_batch(ws.opts, ws.out, ws.err) == 1);
        REQUIRE_FALSE(std::filesystem::exists(ws.opts.state_path));
    }
}
