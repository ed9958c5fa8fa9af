#pragma once

#include "domain/value_objects/Account.hpp"
#include "domain/value_objects/Amount.hpp"
#include "domain/value_objects/Asset.hpp"

namespace amm::services {

// Moves value of external assets; one adapter per asset system.
// The ledger acts as the pool's custody account: it is the spender in
// transfer_from and the sender in transfer. Failures throw PoolError
// (InsufficientBalance, InsufficientAllowance). Any transfer may call back
// into the engine before returning.
class ITokenLedger {
public:
    virtual amm::domain::Amount total_supply(const amm::domain::Asset& asset) const = 0;

    virtual void transfer_from(const amm::domain::Asset& asset,
                               const amm::domain::Account& from,
                               const amm::domain::Account& to,
                               const amm::domain::Amount& amount) = 0;
    virtual void transfer(const amm::domain::Asset& asset,
                          const amm::domain::Account& to,
                          const amm::domain::Amount& amount) = 0;

    // Undo a transfer this ledger applied earlier in the same call, including
    // any allowance it consumed.
    virtual void revert_transfer_from(const amm::domain::Asset& asset,
                                      const amm::domain::Account& from,
                                      const amm::domain::Account& to,
                                      const amm::domain::Amount& amount) = 0;
    virtual void revert_transfer(const amm::domain::Asset& asset,
                                 const amm::domain::Account& to,
                                 const amm::domain::Amount& amount) = 0;

    virtual ~ITokenLedger() = default;
};

} // namespace amm::services
