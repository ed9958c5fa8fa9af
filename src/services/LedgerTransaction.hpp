#pragma once

#include "services/ITokenLedger.hpp"

#include <vector>

namespace amm::services {

// Groups the ledger transfers of one pool call. Unless commit() is reached,
// the destructor reverses every applied transfer, newest first.
class LedgerTransaction {
public:
    LedgerTransaction(ITokenLedger& ledger, amm::domain::Account custody);
    ~LedgerTransaction();

    LedgerTransaction(const LedgerTransaction&) = delete;
    LedgerTransaction& operator=(const LedgerTransaction&) = delete;

    // transfer_from(asset, from, custody, amount)
    void pull(const amm::domain::Asset& asset, const amm::domain::Account& from,
              const amm::domain::Amount& amount);
    // transfer(asset, to, amount)
    void push(const amm::domain::Asset& asset, const amm::domain::Account& to,
              const amm::domain::Amount& amount);

    void commit() noexcept { applied_.clear(); }
    void rollback();

    size_t pending() const noexcept { return applied_.size(); }

private:
    enum class Direction { PULL, PUSH };

    struct Transfer {
        Direction direction;
        amm::domain::Asset asset;
        amm::domain::Account counterparty;
        amm::domain::Amount amount;
    };

    ITokenLedger& ledger_;
    amm::domain::Account custody_;
    std::vector<Transfer> applied_;
};

} // namespace amm::services
