// =============================================================================
// codec.cpp - LedgerState <-> JSON blob
// =============================================================================

#include "swaptrade/codec.hpp"
#include "swaptrade/log.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace swaptrade {

using json = nlohmann::json;

namespace {

class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

// =============================================================================
// Field Helpers
// =============================================================================

I128 read_amount(const json& obj, const char* key) {
    const json& value = obj.at(key);
    std::string text = value.is_string() ? value.get<std::string>() : value.dump();
    auto parsed = parse_i128(text);
    if (!parsed) throw DecodeError(std::string("bad amount in ") + key);
    if (*parsed < 0) throw DecodeError(std::string("negative amount in ") + key);
    return *parsed;
}

// Signed: batch amounts must reach the dispatcher's checks, pnl may be negative
I128 read_signed(const json& obj, const char* key) {
    if (!obj.contains(key)) return 0;
    const json& value = obj.at(key);
    std::string text = value.is_string() ? value.get<std::string>() : value.dump();
    auto parsed = parse_i128(text);
    if (!parsed) throw DecodeError(std::string("bad amount in ") + key);
    return *parsed;
}

Address read_address(const json& value) {
    auto addr = addresses::from_hex(value.get<std::string>());
    if (!addr) throw DecodeError("bad identity " + value.get<std::string>());
    return *addr;
}

Asset read_asset(const json& value) {
    auto asset = Asset::from_code(value.get<std::string>());
    if (!asset) throw DecodeError("empty asset code");
    return *asset;
}

json encode_record(const SwapRecord& rec) {
    return json{
        {"timestamp", rec.timestamp},
        {"from_asset", rec.from_asset.code()},
        {"to_asset", rec.to_asset.code()},
        {"amount_in", to_string(rec.amount_in)},
        {"amount_out", to_string(rec.amount_out)},
        {"fee", to_string(rec.fee)},
        {"rate_e7", to_string(rec.rate_e7)},
    };
}

SwapRecord decode_record(const json& obj) {
    SwapRecord rec;
    rec.timestamp = obj.at("timestamp").get<uint64_t>();
    rec.from_asset = read_asset(obj.at("from_asset"));
    rec.to_asset = read_asset(obj.at("to_asset"));
    rec.amount_in = read_amount(obj, "amount_in");
    rec.amount_out = read_amount(obj, "amount_out");
    rec.fee = read_amount(obj, "fee");
    rec.rate_e7 = read_amount(obj, "rate_e7");
    return rec;
}

void check(int32_t status, const char* what) {
    if (status != errors::OK) {
        throw DecodeError(std::string(what) + ": " + error_name(status));
    }
}

} // anonymous namespace

// =============================================================================
// Encode
// =============================================================================

std::string encode_state(const LedgerState& state) {
    json doc;
    doc["version"] = state.metrics.version();
    doc["timestamp"] = state.metrics.timestamp();
    doc["admin"] = addresses::to_hex(state.admin);
    doc["paused"] = state.paused;
    doc["halted"] = state.halted;

    doc["fee_config"] = {
        {"swap_fee_bps", state.swap_fee_bps},
        {"transfer_fee_bps", state.transfer_fee_bps},
        {"swap_fee_routing", fee_routing_name(state.swap_fee_routing)},
    };

    json users = json::array();
    for (const auto& user : state.balances.users()) users.push_back(addresses::to_hex(user));
    json assets = json::array();
    for (const auto& asset : state.balances.assets()) assets.push_back(asset.code());
    doc["user_index"] = std::move(users);
    doc["asset_index"] = std::move(assets);

    json balances = json::array();
    for (const auto& user : state.balances.users()) {
        for (const auto& [asset, amount] : state.balances.balances_of(user)) {
            balances.push_back({
                {"user", addresses::to_hex(user)},
                {"asset", asset.code()},
                {"amount", to_string(amount)},
            });
        }
    }
    doc["balances"] = std::move(balances);

    const LiquidityPool& pool = state.pool;
    json positions = json::array();
    for (const auto& provider : pool.providers()) {
        auto pos = pool.position(provider);
        if (!pos) continue;
        positions.push_back({
            {"owner", addresses::to_hex(pos->owner)},
            {"asset_a_deposited", to_string(pos->asset_a_deposited)},
            {"asset_b_deposited", to_string(pos->asset_b_deposited)},
            {"lp_tokens", to_string(pos->lp_tokens)},
        });
    }
    doc["pool"] = {
        {"asset_a", pool.asset_a().code()},
        {"asset_b", pool.asset_b().code()},
        {"reserve_a", to_string(pool.reserve_a())},
        {"reserve_b", to_string(pool.reserve_b())},
        {"lp_total_supply", to_string(pool.lp_total_supply())},
        {"positions", std::move(positions)},
    };

    doc["fee_accumulator"] = to_string(state.fee_accumulator);
    doc["total_minted"] = to_string(state.total_minted);

    const Metrics& m = state.metrics.metrics();
    doc["metrics"] = {
        {"trade_count", m.trade_count},
        {"failed_order_count", m.failed_order_count},
        {"balances_updated", m.balances_updated},
        {"total_volume", to_string(m.total_volume)},
    };

    json history = json::array();
    for (const auto& [user, records] : state.history) {
        json recs = json::array();
        for (const auto& rec : records) recs.push_back(encode_record(rec));
        history.push_back({{"user", addresses::to_hex(user)}, {"records", std::move(recs)}});
    }
    doc["history"] = std::move(history);

    // Active-user order is the trader order
    json traders = json::array();
    for (const auto& user : state.active_users) {
        const TraderStats& stats = state.traders.at(user);
        traders.push_back({
            {"user", addresses::to_hex(user)},
            {"trade_count", stats.trade_count},
            {"swap_volume", to_string(stats.swap_volume)},
            {"pnl", to_string(stats.pnl)},
        });
    }
    doc["traders"] = std::move(traders);

    return doc.dump(2);
}

// =============================================================================
// Decode
// =============================================================================

int32_t decode_state(std::string_view blob, LedgerState& out) {
    json doc = json::parse(blob.begin(), blob.end(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        logger()->debug("state blob is not a JSON object");
        return errors::INVALID_STATE;
    }

    try {
        LedgerState state;
        state.admin = read_address(doc.at("admin"));
        state.paused = doc.at("paused").get<bool>();
        state.halted = doc.value("halted", false);

        const json& fee_config = doc.at("fee_config");
        state.swap_fee_bps = fee_config.at("swap_fee_bps").get<uint32_t>();
        state.transfer_fee_bps = fee_config.at("transfer_fee_bps").get<uint32_t>();
        if (state.swap_fee_bps > fees::MAX_FEE_BPS || state.transfer_fee_bps > fees::MAX_FEE_BPS) {
            throw DecodeError("fee rate above ceiling");
        }
        auto routing = parse_fee_routing(fee_config.at("swap_fee_routing").get<std::string>());
        if (!routing) throw DecodeError("unknown fee routing");
        state.swap_fee_routing = *routing;

        // Balances: collect, then replay over the indexes in order
        std::vector<Address> users;
        for (const auto& u : doc.at("user_index")) users.push_back(read_address(u));
        std::vector<Asset> assets;
        for (const auto& a : doc.at("asset_index")) assets.push_back(read_asset(a));

        std::map<BalanceKey, I128> amounts;
        for (const auto& entry : doc.at("balances")) {
            BalanceKey key{read_address(entry.at("user")), read_asset(entry.at("asset"))};
            if (!amounts.emplace(key, read_amount(entry, "amount")).second) {
                throw DecodeError("duplicate balance for " + addresses::to_hex(key.user));
            }
        }

        size_t replayed = 0;
        for (const auto& user : users) {
            for (const auto& asset : assets) {
                auto it = amounts.find(BalanceKey{user, asset});
                I128 amount = it != amounts.end() ? it->second : 0;
                if (it != amounts.end()) ++replayed;
                check(state.balances.credit(user, asset, amount), "balance replay");
            }
        }
        if (replayed != amounts.size()) {
            throw DecodeError("balance entry outside user/asset index");
        }

        // Pool
        const json& pool = doc.at("pool");
        LiquidityPool restored(read_asset(pool.at("asset_a")), read_asset(pool.at("asset_b")));
        if (restored.asset_a() == restored.asset_b()) {
            throw DecodeError("pool assets must differ");
        }
        std::vector<LPPosition> positions;
        for (const auto& p : pool.at("positions")) {
            positions.push_back(LPPosition{
                read_address(p.at("owner")),
                read_amount(p, "asset_a_deposited"),
                read_amount(p, "asset_b_deposited"),
                read_amount(p, "lp_tokens"),
            });
        }
        check(restored.restore(read_amount(pool, "reserve_a"), read_amount(pool, "reserve_b"),
                               read_amount(pool, "lp_total_supply"), positions),
              "pool restore");
        state.pool = std::move(restored);

        state.fee_accumulator = read_amount(doc, "fee_accumulator");
        state.total_minted = read_amount(doc, "total_minted");

        const json& metrics = doc.at("metrics");
        Metrics m{
            metrics.at("trade_count").get<uint64_t>(),
            metrics.at("failed_order_count").get<uint64_t>(),
            metrics.at("balances_updated").get<uint64_t>(),
            read_amount(metrics, "total_volume"),
        };
        state.metrics.restore(m, doc.at("version").get<uint32_t>(),
                              doc.at("timestamp").get<uint64_t>());

        if (doc.contains("history")) {
            for (const auto& entry : doc.at("history")) {
                auto& records = state.history[read_address(entry.at("user"))];
                for (const auto& rec : entry.at("records")) records.push_back(decode_record(rec));
            }
        }

        if (doc.contains("traders")) {
            for (const auto& entry : doc.at("traders")) {
                Address user = read_address(entry.at("user"));
                TraderStats stats;
                stats.trade_count = entry.at("trade_count").get<uint64_t>();
                stats.swap_volume = read_amount(entry, "swap_volume");
                stats.pnl = read_signed(entry, "pnl");
                if (stats.trade_count == 0) {
                    throw DecodeError("trader without trades " + addresses::to_hex(user));
                }
                if (!state.traders.emplace(user, stats).second) {
                    throw DecodeError("duplicate trader " + addresses::to_hex(user));
                }
                state.active_users.push_back(user);
            }
        }

        out = std::move(state);
        return errors::OK;
    } catch (const json::exception& e) {
        logger()->debug("state blob rejected: {}", e.what());
    } catch (const DecodeError& e) {
        logger()->debug("state blob rejected: {}", e.what());
    }
    return errors::INVALID_STATE;
}

// =============================================================================
// Batch Files
// =============================================================================

namespace {

bool is_admin_op(OpKind op) {
    switch (op) {
        case OpKind::MINT:
        case OpKind::SET_ADMIN:
        case OpKind::PAUSE:
        case OpKind::RESUME:
        case OpKind::MIGRATE:
        case OpKind::SET_SWAP_FEE:
        case OpKind::SET_TRANSFER_FEE:
        case OpKind::SET_FEE_ROUTING:
            return true;
        default:
            return false;
    }
}

BatchOperation decode_operation(const json& obj, const Address& admin) {
    std::string name = obj.at("op").get<std::string>();
    auto kind = parse_op(name);
    if (!kind) throw DecodeError("unknown op " + name);

    BatchOperation op{};
    op.op = *kind;
    op.ctx.timestamp = obj.value("timestamp", uint64_t{0});
    if (obj.contains("user")) op.user = read_address(obj.at("user"));
    if (obj.contains("caller")) {
        op.ctx.caller = read_address(obj.at("caller"));
    } else {
        op.ctx.caller = is_admin_op(op.op) ? admin : op.user;
    }

    if (obj.contains("asset")) op.from_asset = read_asset(obj.at("asset"));
    if (obj.contains("from")) op.from_asset = read_asset(obj.at("from"));
    if (obj.contains("to")) op.to_asset = read_asset(obj.at("to"));

    op.amount = read_signed(obj, "amount");
    op.amount_b = read_signed(obj, "amount_b");
    op.min_out = read_signed(obj, "min_out");
    op.value = obj.value("value", uint32_t{0});

    if (obj.contains("routing")) {
        auto routing = parse_fee_routing(obj.at("routing").get<std::string>());
        if (!routing) throw DecodeError("unknown routing");
        op.routing = *routing;
    }
    return op;
}

} // anonymous namespace

int32_t decode_batch(std::string_view blob, const Address& admin,
                     std::vector<BatchOperation>& out) {
    json doc = json::parse(blob.begin(), blob.end(), nullptr, false);
    if (doc.is_discarded() || !doc.is_array()) {
        logger()->debug("batch is not a JSON array");
        return errors::INVALID_STATE;
    }

    try {
        std::vector<BatchOperation> ops;
        ops.reserve(doc.size());
        for (const auto& entry : doc) {
            ops.push_back(decode_operation(entry, admin));
        }
        out = std::move(ops);
        return errors::OK;
    } catch (const json::exception& e) {
        logger()->debug("batch rejected: {}", e.what());
    } catch (const DecodeError& e) {
        logger()->debug("batch rejected: {}", e.what());
    }
    return errors::INVALID_STATE;
}

} // namespace swaptrade
