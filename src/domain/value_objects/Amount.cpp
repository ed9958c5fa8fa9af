#include "domain/value_objects/Amount.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace amm::domain {

Amount::Amount(uint64_t value) : value_(value) {}

Amount::Amount(uint256 value) : value_(std::move(value)) {}

Amount Amount::from_string(const std::string& str) {
    if (str.empty() || !std::all_of(str.begin(), str.end(),
                                    [](unsigned char c) { return std::isdigit(c); })) {
        throw std::invalid_argument("Amount must be a decimal integer, got: '" + str + "'");
    }
    boost::multiprecision::cpp_int parsed(str);
    if (parsed > boost::multiprecision::cpp_int(std::numeric_limits<uint256>::max())) {
        throw std::out_of_range("Amount exceeds 256 bits: " + str);
    }
    return Amount(static_cast<uint256>(parsed));
}

Amount Amount::zero() {
    return Amount(uint64_t{0});
}

Amount Amount::operator+(const Amount& other) const {
    uint256 sum = value_ + other.value_;
    if (sum < value_) {
        throw std::overflow_error("Amount addition overflows 256 bits");
    }
    return Amount(sum);
}

Amount Amount::operator-(const Amount& other) const {
    if (other.value_ > value_) {
        throw std::underflow_error(
            "Amount subtraction below zero: " + to_string() + " - " + other.to_string());
    }
    return Amount(uint256(value_ - other.value_));
}

std::strong_ordering Amount::operator<=>(const Amount& other) const {
    if (value_ < other.value_) return std::strong_ordering::less;
    if (other.value_ < value_) return std::strong_ordering::greater;
    return std::strong_ordering::equal;
}

std::ostream& operator<<(std::ostream& os, const Amount& amount) {
    return os << amount.to_string();
}

} // namespace amm::domain
