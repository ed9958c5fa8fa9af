#pragma once

#include "services/ITokenLedger.hpp"

#include <map>
#include <utility>

namespace amm::infrastructure {

// Ledger kept in process memory. Allowances are granted to the custody account,
// which is also the sender of transfer().
class InMemoryTokenLedger : public amm::services::ITokenLedger {
public:
    explicit InMemoryTokenLedger(amm::domain::Account custody);

    // ITokenLedger
    amm::domain::Amount total_supply(const amm::domain::Asset& asset) const override;
    void transfer_from(const amm::domain::Asset& asset, const amm::domain::Account& from,
                       const amm::domain::Account& to, const amm::domain::Amount& amount) override;
    void transfer(const amm::domain::Asset& asset, const amm::domain::Account& to,
                  const amm::domain::Amount& amount) override;
    void revert_transfer_from(const amm::domain::Asset& asset, const amm::domain::Account& from,
                              const amm::domain::Account& to,
                              const amm::domain::Amount& amount) override;
    void revert_transfer(const amm::domain::Asset& asset, const amm::domain::Account& to,
                         const amm::domain::Amount& amount) override;

    // Issuance and approvals
    void mint(const amm::domain::Asset& asset, const amm::domain::Account& to,
              const amm::domain::Amount& amount);
    void approve(const amm::domain::Asset& asset, const amm::domain::Account& owner,
                 const amm::domain::Amount& amount);
    // Registers an asset with nothing issued
    void declare(const amm::domain::Asset& asset);

    amm::domain::Amount balance_of(const amm::domain::Asset& asset,
                                   const amm::domain::Account& account) const;
    amm::domain::Amount allowance(const amm::domain::Asset& asset,
                                  const amm::domain::Account& owner) const;
    const amm::domain::Account& custody() const noexcept { return custody_; }

private:
    using Holding = std::pair<amm::domain::Asset, amm::domain::Account>;

    void move_balance(const amm::domain::Asset& asset, const amm::domain::Account& from,
              const amm::domain::Account& to, const amm::domain::Amount& amount);

    amm::domain::Account custody_;
    std::map<amm::domain::Asset, amm::domain::Amount> supplies_;
    std::map<Holding, amm::domain::Amount> balances_;
    std::map<Holding, amm::domain::Amount> allowances_;
};

} // namespace amm::infrastructure
