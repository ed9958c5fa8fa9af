#include "domain/errors/PoolError.hpp"

namespace amm::domain {

const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::DuplicateAsset: return "DuplicateAsset";
        case ErrorCode::InvalidAsset: return "InvalidAsset";
        case ErrorCode::IdenticalAssets: return "IdenticalAssets";
        case ErrorCode::AssetNotRegistered: return "AssetNotRegistered";
        case ErrorCode::PairAlreadyExists: return "PairAlreadyExists";
        case ErrorCode::PairNotFound: return "PairNotFound";
        case ErrorCode::InsufficientLiquidity: return "InsufficientLiquidity";
        case ErrorCode::InvalidAssetPair: return "InvalidAssetPair";
        case ErrorCode::InsufficientInput: return "InsufficientInput";
        case ErrorCode::InsufficientOutput: return "InsufficientOutput";
        case ErrorCode::InsufficientBalance: return "InsufficientBalance";
        case ErrorCode::InsufficientAllowance: return "InsufficientAllowance";
        case ErrorCode::ReentrancyViolation: return "ReentrancyViolation";
    }
    return "Unknown";
}

ErrorCategory error_category(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InsufficientBalance:
        case ErrorCode::InsufficientAllowance:
            return ErrorCategory::LEDGER;
        case ErrorCode::ReentrancyViolation:
            return ErrorCategory::CONCURRENCY;
        default:
            return ErrorCategory::VALIDATION;
    }
}

PoolError::PoolError(ErrorCode code, const std::string& detail)
    : std::runtime_error(std::string(error_code_name(code)) + ": " + detail)
    , code_(code) {}

} // namespace amm::domain
