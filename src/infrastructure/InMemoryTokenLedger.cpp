#include "infrastructure/InMemoryTokenLedger.hpp"

#include "domain/errors/PoolError.hpp"

#include <stdexcept>

using namespace amm::domain;

namespace amm::infrastructure {

InMemoryTokenLedger::InMemoryTokenLedger(Account custody)
    : custody_(std::move(custody)) {}

Amount InMemoryTokenLedger::total_supply(const Asset& asset) const {
    auto it = supplies_.find(asset);
    if (it == supplies_.end()) {
        throw std::out_of_range("Unknown asset: " + asset.id());
    }
    return it->second;
}

void InMemoryTokenLedger::transfer_from(const Asset& asset, const Account& from,
                                        const Account& to, const Amount& amount) {
    auto granted = allowance(asset, from);
    if (granted < amount) {
        throw PoolError(ErrorCode::InsufficientAllowance,
                        from.id() + " approved " + granted.to_string() + " of " + asset.id()
                        + ", needs " + amount.to_string());
    }
    move_balance(asset, from, to, amount);
    allowances_[{asset, from}] = granted - amount;
}

void InMemoryTokenLedger::transfer(const Asset& asset, const Account& to, const Amount& amount) {
    move_balance(asset, custody_, to, amount);
}

void InMemoryTokenLedger::revert_transfer_from(const Asset& asset, const Account& from,
                                               const Account& to, const Amount& amount) {
    move_balance(asset, to, from, amount);
    allowances_[{asset, from}] = allowance(asset, from) + amount;
}

void InMemoryTokenLedger::revert_transfer(const Asset& asset, const Account& to,
                                          const Amount& amount) {
    move_balance(asset, to, custody_, amount);
}

void InMemoryTokenLedger::mint(const Asset& asset, const Account& to, const Amount& amount) {
    auto& supply = supplies_[asset];
    supply = supply + amount;
    auto& balance = balances_[{asset, to}];
    balance = balance + amount;
}

void InMemoryTokenLedger::approve(const Asset& asset, const Account& owner, const Amount& amount) {
    allowances_.insert_or_assign(Holding{asset, owner}, amount);
}

void InMemoryTokenLedger::declare(const Asset& asset) {
    supplies_.try_emplace(asset, Amount::zero());
}

Amount InMemoryTokenLedger::balance_of(const Asset& asset, const Account& account) const {
    auto it = balances_.find({asset, account});
    return it != balances_.end() ? it->second : Amount::zero();
}

Amount InMemoryTokenLedger::allowance(const Asset& asset, const Account& owner) const {
    auto it = allowances_.find({asset, owner});
    return it != allowances_.end() ? it->second : Amount::zero();
}

void InMemoryTokenLedger::move_balance(const Asset& asset, const Account& from,
                               const Account& to, const Amount& amount) {
    auto available = balance_of(asset, from);
    if (available < amount) {
        throw PoolError(ErrorCode::InsufficientBalance,
                        from.id() + " holds " + available.to_string() + " of " + asset.id()
                        + ", needs " + amount.to_string());
    }
    balances_.insert_or_assign(Holding{asset, from}, available - amount);
    balances_.insert_or_assign(Holding{asset, to}, balance_of(asset, to) + amount);
}

} // namespace amm::infrastructure
