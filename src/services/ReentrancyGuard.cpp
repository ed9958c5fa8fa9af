#include "services/ReentrancyGuard.hpp"

#include "domain/errors/PoolError.hpp"

namespace amm::services {

ReentrancyGuard::Scope::Scope(ReentrancyGuard& guard)
    : guard_(guard)
    , lock_(guard.mutex_) {
    if (guard_.depth_ > 0) {
        // lock_ releases the recursive acquisition during unwinding
        throw amm::domain::PoolError(amm::domain::ErrorCode::ReentrancyViolation,
                                     "pool call re-entered before the outer call committed");
    }
    ++guard_.depth_;
}

ReentrancyGuard::Scope::~Scope() {
    --guard_.depth_;
}

} // namespace amm::services
