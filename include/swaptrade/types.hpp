#ifndef SWAPTRADE_TYPES_HPP
#define SWAPTRADE_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <optional>

namespace swaptrade {

// =============================================================================
// Fixed-Point Amounts
// =============================================================================

// All amounts are integers in the base denomination of their asset.
using I128 = __int128;
using U128 = unsigned __int128;

constexpr I128 I128_MAX = static_cast<I128>(~U128(0) >> 1);
constexpr I128 I128_MIN = -I128_MAX - 1;

// Decimal rendering / parsing (128-bit integers have no iostream support)
std::string to_string(I128 value);
std::optional<I128> parse_i128(std::string_view text);

// =============================================================================
// Identity (20-byte account address)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

constexpr Address ZERO = {};

// Helper to create a test/fixture address from a small number
constexpr Address from_id(uint16_t id) {
    Address addr = {};
    addr[18] = static_cast<uint8_t>((id >> 8) & 0xFF);
    addr[19] = static_cast<uint8_t>(id & 0xFF);
    return addr;
}

// "0x" + 40 hex digits
std::string to_hex(const Address& addr);
std::optional<Address> from_hex(std::string_view text);

} // namespace addresses

// =============================================================================
// Asset (tagged variant: native XLM or a custom symbol)
// =============================================================================

enum class AssetKind : uint8_t {
    NATIVE_XLM = 0,
    CUSTOM = 1
};

struct Asset {
    AssetKind kind;
    std::string symbol;      // Empty for NATIVE_XLM

    Asset() : kind(AssetKind::NATIVE_XLM) {}

    static Asset xlm() { return Asset(); }
    // The code "XLM" is reserved for the native asset, so custom("XLM")
    // yields it too and code() / from_code() round-trip every Asset
    static Asset custom(std::string sym) {
        Asset a;
        if (sym == "XLM") return a;
        a.kind = AssetKind::CUSTOM;
        a.symbol = std::move(sym);
        return a;
    }

    // "XLM" parses to the native asset, anything else is custom
    static std::optional<Asset> from_code(std::string_view code);

    bool is_native() const { return kind == AssetKind::NATIVE_XLM; }
    std::string code() const { return is_native() ? "XLM" : symbol; }

    bool operator==(const Asset& other) const {
        return kind == other.kind && symbol == other.symbol;
    }
    bool operator!=(const Asset& other) const { return !(*this == other); }
    bool operator<(const Asset& other) const {
        if (kind != other.kind) return kind < other.kind;
        return symbol < other.symbol;
    }
};

// Default pool pair
inline const Asset NATIVE_XLM = Asset::xlm();
inline const Asset USDC = Asset::custom("USDC");

// =============================================================================
// Balance Key (user, asset)
// =============================================================================

struct BalanceKey {
    Address user;
    Asset asset;

    bool operator==(const BalanceKey& other) const {
        return user == other.user && asset == other.asset;
    }
    bool operator<(const BalanceKey& other) const {
        if (user != other.user) return user < other.user;
        return asset < other.asset;
    }
};

// =============================================================================
// Fee Routing
// =============================================================================

// Where the fee withheld from a pool swap ends up
enum class FeeRouting : uint8_t {
    POOL = 0,          // Stays in the input reserve as LP revenue
    ACCUMULATOR = 1    // Moved to the global fee accumulator
};

const char* fee_routing_name(FeeRouting routing);
std::optional<FeeRouting> parse_fee_routing(std::string_view name);

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t INVALID_AMOUNT = -1;
constexpr int32_t INSUFFICIENT_BALANCE = -2;
constexpr int32_t INSUFFICIENT_LIQUIDITY = -3;
constexpr int32_t SAME_ASSET_SWAP = -4;
constexpr int32_t INVALID_ASSET = -5;
constexpr int32_t INSUFFICIENT_LP_TOKENS = -6;
constexpr int32_t SLIPPAGE_EXCEEDED = -7;
constexpr int32_t AMOUNT_OVERFLOW = -8;
constexpr int32_t FEE_CONFIGURATION_INVALID = -10;
constexpr int32_t TRADING_PAUSED = -11;
constexpr int32_t BATCH_TOO_LARGE = -12;
constexpr int32_t INVALID_STATE = -13;
constexpr int32_t UNAUTHORIZED = -40;
// Fatal: host assumptions or internal consistency broken
constexpr int32_t INVARIANT_VIOLATION = -50;
constexpr int32_t CLOCK_REGRESSION = -51;
constexpr int32_t INVALID_MIGRATION = -52;
constexpr int32_t HALTED = -53;
}

const char* error_name(int32_t code);

// Fatal codes signal a broken assumption, not a user error
inline bool is_fatal(int32_t code) {
    return code == errors::INVARIANT_VIOLATION ||
           code == errors::CLOCK_REGRESSION ||
           code == errors::INVALID_MIGRATION;
}

} // namespace swaptrade

#endif // SWAPTRADE_TYPES_HPP
