#ifndef SWAPTRADE_LEDGER_HPP
#define SWAPTRADE_LEDGER_HPP

#include <map>
#include <set>
#include <vector>
#include <optional>
#include <utility>

#include "types.hpp"

namespace swaptrade {

// =============================================================================
// BalanceLedger - (user, asset) -> non-negative amount
// =============================================================================
//
// The balance map is treated as a key-value store that cannot be iterated.
// Every user and asset that was ever credited is appended to an index, and
// all full-ledger sums walk those indexes.

class BalanceLedger {
public:
    BalanceLedger() = default;

    // Returns 0 for keys never credited
    I128 read(const Address& user, const Asset& asset) const;

    // amount >= 0; AMOUNT_OVERFLOW instead of wrapping
    int32_t credit(const Address& user, const Asset& asset, I128 amount);

    // INSUFFICIENT_BALANCE if amount > balance; balance left unchanged
    int32_t debit(const Address& user, const Asset& asset, I128 amount);

    // =========================================================================
    // Index Access
    // =========================================================================

    const std::vector<Address>& users() const { return user_index_; }
    const std::vector<Asset>& assets() const { return asset_index_; }
    bool has_user(const Address& user) const;
    size_t user_count() const { return user_index_.size(); }

    // Sum over user_index x asset_index; nullopt on overflow
    std::optional<I128> total() const;
    std::optional<I128> total_of(const Asset& asset) const;

    // Non-zero balances of one user, in asset index order
    std::vector<std::pair<Asset, I128>> balances_of(const Address& user) const;

private:
    std::map<BalanceKey, I128> balances_;

    // Append-only indexes
    std::vector<Address> user_index_;
    std::set<Address> known_users_;
    std::vector<Asset> asset_index_;
    std::set<Asset> known_assets_;

    void index(const Address& user, const Asset& asset);
};

} // namespace swaptrade

#endif // SWAPTRADE_LEDGER_HPP
