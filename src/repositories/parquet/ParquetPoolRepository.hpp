#pragma once

#include "config/Settings.hpp"
#include "repositories/IPoolRepository.hpp"

#include <arrow/api.h>
#include <arrow/filesystem/api.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace amm::repositories::pq {

class ParquetPoolRepository : public amm::repositories::IPoolRepository {
public:
    ParquetPoolRepository(std::shared_ptr<arrow::fs::FileSystem> fs,
                          const amm::config::StorageSettings& settings);

    /// Create a local filesystem rooted at root_dir (creates dir if needed).
    static std::shared_ptr<arrow::fs::FileSystem> make_local_fs(const std::string& root_dir);
    ~ParquetPoolRepository() override;

    // IPoolRepository
    void append_event(const amm::domain::PoolEventVariant& event) override;
    std::vector<amm::domain::PoolEventVariant> get_events_since(
        uint64_t sequence_number) const override;
    void store_snapshot(const amm::domain::PoolSnapshot& snapshot) override;
    std::optional<amm::domain::PoolSnapshot> get_latest_snapshot() const override;

    /// Write all buffered events.
    void flush();

private:
    void maybe_flush();
    void flush_locked();
    void flush_buffer(const std::string& event_type,
                      const std::vector<amm::domain::PoolEventVariant>& events);

    // File path helpers
    static std::string events_dir(const std::string& event_type);
    static std::string snapshot_dir(uint64_t sequence_number);

    // Parquet read/write
    void write_asset_registered(const std::string& path,
                                const std::vector<amm::domain::PoolEventVariant>& events);
    void write_pair_created(const std::string& path,
                            const std::vector<amm::domain::PoolEventVariant>& events);
    void write_swap_executed(const std::string& path,
                             const std::vector<amm::domain::PoolEventVariant>& events);
    void write_snapshot_files(const std::string& dir,
                              const amm::domain::PoolSnapshot& snapshot);
    void write_table(const std::string& path, const arrow::Table& table) const;
    std::shared_ptr<arrow::Table> read_table(const std::string& path) const;
    std::optional<uint64_t> read_manifest_sequence() const;

    std::vector<amm::domain::PoolEventVariant> read_events_from_directory(
        const std::string& event_type, uint64_t min_sequence) const;

    std::shared_ptr<arrow::fs::FileSystem> fs_;
    amm::config::StorageSettings settings_;
    mutable std::mutex mutex_;

    // Buffers per event type
    std::vector<amm::domain::PoolEventVariant> asset_buffer_;
    std::vector<amm::domain::PoolEventVariant> pair_buffer_;
    std::vector<amm::domain::PoolEventVariant> swap_buffer_;

    std::chrono::steady_clock::time_point last_flush_time_;
};

} // namespace amm::repositories::pq
