// =============================================================================
// types.cpp - Amount/Address/Asset helpers and error names
// =============================================================================

#include "swaptrade/types.hpp"
#include <algorithm>

namespace swaptrade {

// =============================================================================
// 128-bit Decimal Conversion
// =============================================================================

std::string to_string(I128 value) {
    if (value == 0) return "0";

    bool neg = value < 0;
    // Work in unsigned space so the minimum value does not overflow on negation
    U128 mag = neg ? U128(0) - static_cast<U128>(value) : static_cast<U128>(value);

    std::string out;
    while (mag != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(mag % 10)));
        mag /= 10;
    }
    if (neg) out.push_back('-');
    std::reverse(out.begin(), out.end());
    return out;
}

std::optional<I128> parse_i128(std::string_view text) {
    if (text.empty()) return std::nullopt;

    bool neg = false;
    size_t pos = 0;
    if (text[0] == '-' || text[0] == '+') {
        neg = text[0] == '-';
        pos = 1;
    }
    if (pos == text.size()) return std::nullopt;

    const U128 limit = neg ? static_cast<U128>(I128_MAX) + 1 : static_cast<U128>(I128_MAX);
    U128 mag = 0;
    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c < '0' || c > '9') return std::nullopt;
        U128 digit = static_cast<U128>(c - '0');
        if (mag > (limit - digit) / 10) return std::nullopt;
        mag = mag * 10 + digit;
    }

    if (neg) {
        return static_cast<I128>(U128(0) - mag);
    }
    return static_cast<I128>(mag);
}

// =============================================================================
// Address Hex Encoding
// =============================================================================

namespace addresses {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string to_hex(const Address& addr) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + addr.size() * 2);
    for (uint8_t b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

std::optional<Address> from_hex(std::string_view text) {
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2);
    }

    Address addr{};
    if (text.size() != addr.size() * 2) return std::nullopt;

    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(text[2 * i]);
        int lo = hex_value(text[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

} // namespace addresses

// =============================================================================
// Asset
// =============================================================================

std::optional<Asset> Asset::from_code(std::string_view code) {
    if (code.empty()) return std::nullopt;
    if (code == "XLM") return Asset::xlm();
    return Asset::custom(std::string(code));
}

// =============================================================================
// Fee Routing
// =============================================================================

const char* fee_routing_name(FeeRouting routing) {
    switch (routing) {
        case FeeRouting::POOL:        return "pool";
        case FeeRouting::ACCUMULATOR: return "accumulator";
    }
    return "unknown";
}

std::optional<FeeRouting> parse_fee_routing(std::string_view name) {
    if (name == "pool") return FeeRouting::POOL;
    if (name == "accumulator") return FeeRouting::ACCUMULATOR;
    return std::nullopt;
}

// =============================================================================
// Error Names
// =============================================================================

const char* error_name(int32_t code) {
    switch (code) {
        case errors::OK:                        return "Ok";
        case errors::INVALID_AMOUNT:            return "InvalidAmount";
        case errors::INSUFFICIENT_BALANCE:      return "InsufficientBalance";
        case errors::INSUFFICIENT_LIQUIDITY:    return "InsufficientLiquidity";
        case errors::SAME_ASSET_SWAP:           return "SameAssetSwap";
        case errors::INVALID_ASSET:             return "InvalidAsset";
        case errors::INSUFFICIENT_LP_TOKENS:    return "InsufficientLPTokens";
        case errors::SLIPPAGE_EXCEEDED:         return "SlippageExceeded";
        case errors::AMOUNT_OVERFLOW:           return "AmountOverflow";
        case errors::FEE_CONFIGURATION_INVALID: return "FeeConfigurationInvalid";
        case errors::TRADING_PAUSED:            return "TradingPaused";
        case errors::BATCH_TOO_LARGE:           return "BatchTooLarge";
        case errors::INVALID_STATE:             return "InvalidState";
        case errors::UNAUTHORIZED:              return "Unauthorized";
        case errors::INVARIANT_VIOLATION:       return "InvariantViolation";
        case errors::CLOCK_REGRESSION:          return "ClockRegression";
        case errors::INVALID_MIGRATION:         return "InvalidMigration";
        case errors::HALTED:                    return "Halted";
        default:                                return "Unknown";
    }
}

} // namespace swaptrade
