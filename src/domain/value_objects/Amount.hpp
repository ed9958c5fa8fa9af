#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include <compare>
#include <cstdint>
#include <ostream>
#include <string>

namespace amm::domain {

using uint256 = boost::multiprecision::uint256_t;
using uint512 = boost::multiprecision::uint512_t;

// Nonnegative token quantity below 2^256. Arithmetic never wraps.
class Amount {
public:
    Amount() = default;
    explicit Amount(uint64_t value);
    explicit Amount(uint256 value);

    static Amount from_string(const std::string& str);
    static Amount zero();

    const uint256& value() const noexcept { return value_; }
    bool is_zero() const { return value_.is_zero(); }
    std::string to_string() const { return value_.str(); }

    Amount operator+(const Amount& other) const;
    Amount operator-(const Amount& other) const;

    bool operator==(const Amount& other) const { return value_ == other.value_; }
    std::strong_ordering operator<=>(const Amount& other) const;

private:
    uint256 value_;
};

std::ostream& operator<<(std::ostream& os, const Amount& amount);

} // namespace amm::domain
