#pragma once

#include <string>

namespace amm::domain {

class Asset {
public:
    explicit Asset(std::string id);

    const std::string& id() const noexcept { return id_; }

    bool operator==(const Asset&) const = default;
    auto operator<=>(const Asset&) const = default;

private:
    std::string id_;
};

} // namespace amm::domain
