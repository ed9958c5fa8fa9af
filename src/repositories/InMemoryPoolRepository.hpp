#pragma once

#include "repositories/IPoolRepository.hpp"

#include <vector>

namespace amm::repositories {

class InMemoryPoolRepository : public amm::repositories::IPoolRepository {
public:
    void append_event(const amm::domain::PoolEventVariant& event) override {
        events_.push_back(event);
    }

    std::vector<amm::domain::PoolEventVariant> get_events_since(
        uint64_t sequence_number) const override {
        std::vector<amm::domain::PoolEventVariant> result;
        for (const auto& event : events_) {
            if (amm::domain::sequence_number_of(event) > sequence_number) {
                result.push_back(event);
            }
        }
        return result;
    }

    void store_snapshot(const amm::domain::PoolSnapshot& snapshot) override {
        snapshot_ = snapshot;
        ++snapshot_count_;
    }

    std::optional<amm::domain::PoolSnapshot> get_latest_snapshot() const override {
        return snapshot_;
    }

    // Test helpers
    size_t event_count() const { return events_.size(); }
    const std::vector<amm::domain::PoolEventVariant>& events() const { return events_; }
    bool has_snapshot() const { return snapshot_.has_value(); }
    size_t snapshot_count() const { return snapshot_count_; }

private:
    std::vector<amm::domain::PoolEventVariant> events_;
    std::optional<amm::domain::PoolSnapshot> snapshot_;
    size_t snapshot_count_{0};
};

} // namespace amm::repositories
