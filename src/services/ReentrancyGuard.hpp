#pragma once

#include <mutex>

namespace amm::services {

// Serialises state-mutating calls and rejects reentry from the call chain that
// already holds the guard. Other threads wait; the same thread fails with
// PoolError(ReentrancyViolation).
class ReentrancyGuard {
public:
    class Scope {
    public:
        explicit Scope(ReentrancyGuard& guard);
        ~Scope();

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

    private:
        ReentrancyGuard& guard_;
        std::unique_lock<std::recursive_mutex> lock_;
    };

    // Shared access for queries; permitted from inside a guarded call.
    std::unique_lock<std::recursive_mutex> observe() const {
        return std::unique_lock<std::recursive_mutex>(mutex_);
    }

private:
    mutable std::recursive_mutex mutex_;
    int depth_{0};
};

} // namespace amm::services
