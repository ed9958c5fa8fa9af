#include "domain/value_objects/Account.hpp"

#include <stdexcept>

namespace amm::domain {

Account::Account(std::string id) : id_(std::move(id)) {
    if (id_.empty()) {
        throw std::invalid_argument("Account id must not be empty");
    }
}

} // namespace amm::domain
