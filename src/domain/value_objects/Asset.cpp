#include "domain/value_objects/Asset.hpp"

#include <stdexcept>

namespace amm::domain {

Asset::Asset(std::string id) : id_(std::move(id)) {
    if (id_.empty()) {
        throw std::invalid_argument("Asset id must not be empty");
    }
}

} // namespace amm::domain
