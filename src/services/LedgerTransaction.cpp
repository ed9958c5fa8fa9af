#include "services/LedgerTransaction.hpp"

#include <exception>
#include <iostream>

using namespace amm::domain;

namespace amm::services {

LedgerTransaction::LedgerTransaction(ITokenLedger& ledger, Account custody)
    : ledger_(ledger)
    , custody_(std::move(custody)) {}

LedgerTransaction::~LedgerTransaction() {
    if (applied_.empty()) return;
    try {
        rollback();
    } catch (const std::exception& e) {
        std::cerr << "[ledger] Rollback failed, " << applied_.size()
                  << " transfer(s) left applied: " << e.what() << std::endl;
    }
}

void LedgerTransaction::pull(const Asset& asset, const Account& from, const Amount& amount) {
    ledger_.transfer_from(asset, from, custody_, amount);
    applied_.push_back(Transfer{Direction::PULL, asset, from, amount});
}

void LedgerTransaction::push(const Asset& asset, const Account& to, const Amount& amount) {
    ledger_.transfer(asset, to, amount);
    applied_.push_back(Transfer{Direction::PUSH, asset, to, amount});
}

void LedgerTransaction::rollback() {
    while (!applied_.empty()) {
        const auto& t = applied_.back();
        if (t.direction == Direction::PULL) {
            ledger_.revert_transfer_from(t.asset, t.counterparty, custody_, t.amount);
        } else {
            ledger_.revert_transfer(t.asset, t.counterparty, t.amount);
        }
        applied_.pop_back();
    }
}

} // namespace amm::services
