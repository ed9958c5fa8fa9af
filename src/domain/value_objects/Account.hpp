#pragma once

#include <string>

namespace amm::domain {

// A holder of balances on a token ledger: a trader, or the pool's custody account.
class Account {
public:
    explicit Account(std::string id);

    const std::string& id() const noexcept { return id_; }

    bool operator==(const Account&) const = default;
    auto operator<=>(const Account&) const = default;

private:
    std::string id_;
};

} // namespace amm::domain
