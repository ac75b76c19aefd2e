// =============================================================================
// ledger.cpp - BalanceLedger
// =============================================================================

#include "swaptrade/ledger.hpp"
#include "swaptrade/math.hpp"

namespace swaptrade {

I128 BalanceLedger::read(const Address& user, const Asset& asset) const {
    auto it = balances_.find(BalanceKey{user, asset});
    return it != balances_.end() ? it->second : 0;
}

int32_t BalanceLedger::credit(const Address& user, const Asset& asset, I128 amount) {
    if (amount < 0) {
        return errors::INVALID_AMOUNT;
    }

    BalanceKey key{user, asset};
    I128 current = 0;
    auto it = balances_.find(key);
    if (it != balances_.end()) current = it->second;

    I128 updated = 0;
    if (!math::checked_add(current, amount, updated)) {
        return errors::AMOUNT_OVERFLOW;
    }

    balances_[key] = updated;
    index(user, asset);
    return errors::OK;
}

int32_t BalanceLedger::debit(const Address& user, const Asset& asset, I128 amount) {
    if (amount < 0) {
        return errors::INVALID_AMOUNT;
    }

    auto it = balances_.find(BalanceKey{user, asset});
    I128 current = it != balances_.end() ? it->second : 0;
    if (amount > current) {
        return errors::INSUFFICIENT_BALANCE;
    }
    if (amount == 0) {
        return errors::OK;
    }

    // amount <= current, cannot underflow
    it->second = current - amount;
    return errors::OK;
}

bool BalanceLedger::has_user(const Address& user) const {
    return known_users_.count(user) != 0;
}

std::optional<I128> BalanceLedger::total() const {
    I128 sum = 0;
    for (const auto& asset : asset_index_) {
        auto part = total_of(asset);
        if (!part || !math::checked_add(sum, *part, sum)) {
            return std::nullopt;
        }
    }
    return sum;
}

std::optional<I128> BalanceLedger::total_of(const Asset& asset) const {
    I128 sum = 0;
    for (const auto& user : user_index_) {
        if (!math::checked_add(sum, read(user, asset), sum)) {
            return std::nullopt;
        }
    }
    return sum;
}

std::vector<std::pair<Asset, I128>> BalanceLedger::balances_of(const Address& user) const {
    std::vector<std::pair<Asset, I128>> out;
    for (const auto& asset : asset_index_) {
        I128 amount = read(user, asset);
        if (amount != 0) out.emplace_back(asset, amount);
    }
    return out;
}

void BalanceLedger::index(const Address& user, const Asset& asset) {
    if (known_users_.insert(user).second) {
        user_index_.push_back(user);
    }
    if (known_assets_.insert(asset).second) {
        asset_index_.push_back(asset);
    }
}

} // namespace swaptrade
