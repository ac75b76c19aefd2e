// =============================================================================
// config.cpp - LedgerConfig loading
// =============================================================================

#include "swaptrade/config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace swaptrade {

using json = nlohmann::json;

namespace {

uint32_t read_bps(const json& doc, const char* key, uint32_t fallback) {
    if (!doc.contains(key)) return fallback;
    const json& value = doc.at(key);
    if (!value.is_number_unsigned()) {
        throw std::runtime_error(std::string("Config: ") + key + " must be a non-negative integer");
    }
    return value.get<uint32_t>();
}

size_t read_size(const json& doc, const char* key, size_t fallback) {
    if (!doc.contains(key)) return fallback;
    const json& value = doc.at(key);
    if (!value.is_number_unsigned()) {
        throw std::runtime_error(std::string("Config: ") + key + " must be a non-negative integer");
    }
    return value.get<size_t>();
}

std::string read_string(const json& doc, const char* key, const std::string& fallback) {
    if (!doc.contains(key)) return fallback;
    const json& value = doc.at(key);
    if (!value.is_string()) {
        throw std::runtime_error(std::string("Config: ") + key + " must be a string");
    }
    return value.get<std::string>();
}

Asset read_asset(const json& doc, const char* key, const Asset& fallback) {
    std::string code = read_string(doc, key, fallback.code());
    auto asset = Asset::from_code(code);
    if (!asset) {
        throw std::runtime_error(std::string("Config: ") + key + " must not be empty");
    }
    return *asset;
}

} // namespace

LedgerConfig LedgerConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

LedgerConfig LedgerConfig::from_json(std::string_view content) {
    json doc = json::parse(content.begin(), content.end(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw std::runtime_error("Config: document is not a JSON object");
    }

    LedgerConfig config;

    if (doc.contains("admin")) {
        std::string hex = read_string(doc, "admin", "");
        auto admin = addresses::from_hex(hex);
        if (!admin) {
            throw std::runtime_error("Config: invalid admin address: " + hex);
        }
        config.admin = *admin;
    }

    config.swap_fee_bps = read_bps(doc, "swap_fee_bps", config.swap_fee_bps);
    config.transfer_fee_bps = read_bps(doc, "transfer_fee_bps", config.transfer_fee_bps);

    if (doc.contains("swap_fee_routing")) {
        std::string name = read_string(doc, "swap_fee_routing", "");
        auto routing = parse_fee_routing(name);
        if (!routing) {
            throw std::runtime_error("Config: unknown swap_fee_routing: " + name);
        }
        config.swap_fee_routing = *routing;
    }

    config.asset_a = read_asset(doc, "asset_a", config.asset_a);
    config.asset_b = read_asset(doc, "asset_b", config.asset_b);
    config.history_limit = read_size(doc, "history_limit", config.history_limit);
    config.max_batch_size = read_size(doc, "max_batch_size", config.max_batch_size);
    config.log_level = read_string(doc, "log_level", config.log_level);

    config.validate();
    return config;
}

void LedgerConfig::validate() const {
    if (swap_fee_bps > fees::MAX_FEE_BPS) {
        throw std::runtime_error("Config: swap_fee_bps above " + std::to_string(fees::MAX_FEE_BPS));
    }
    if (transfer_fee_bps > fees::MAX_FEE_BPS) {
        throw std::runtime_error("Config: transfer_fee_bps above " + std::to_string(fees::MAX_FEE_BPS));
    }
    if (asset_a == asset_b) {
        throw std::runtime_error("Config: asset_a and asset_b must differ");
    }
    if (max_batch_size == 0) {
        throw std::runtime_error("Config: max_batch_size must be positive");
    }
    static const char* LEVELS[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    bool known = false;
    for (const char* level : LEVELS) {
        if (log_level == level) known = true;
    }
    if (!known) {
        throw std::runtime_error("Config: unknown log_level: " + log_level);
    }
}

} // namespace swaptrade
