#pragma once

#include <stdexcept>
#include <string>

namespace amm::domain {

enum class ErrorCode {
    // Validation
    DuplicateAsset,
    InvalidAsset,
    IdenticalAssets,
    AssetNotRegistered,
    PairAlreadyExists,
    PairNotFound,
    InsufficientLiquidity,
    InvalidAssetPair,
    InsufficientInput,
    InsufficientOutput,
    // Ledger
    InsufficientBalance,
    InsufficientAllowance,
    // Concurrency
    ReentrancyViolation,
};

enum class ErrorCategory { VALIDATION, LEDGER, CONCURRENCY };

const char* error_code_name(ErrorCode code) noexcept;
ErrorCategory error_category(ErrorCode code) noexcept;

// Every rejected pool operation throws this. The call it aborts has no effect.
class PoolError : public std::runtime_error {
public:
    PoolError(ErrorCode code, const std::string& detail);

    ErrorCode code() const noexcept { return code_; }
    ErrorCategory category() const noexcept { return error_category(code_); }

private:
    ErrorCode code_;
};

} // namespace amm::domain
