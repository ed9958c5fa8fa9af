#pragma once

#include "domain/value_objects/FeeRate.hpp"

#include <cstdint>
#include <string>

namespace amm::config {

struct PoolSettings {
    std::string custody_account = "amm-pool";
    // Engine-wide swap fee, 0.3% by default
    uint32_t fee_numerator = 3;
    uint32_t fee_denominator = 1000;

    amm::domain::FeeRate fee_rate() const { return {fee_numerator, fee_denominator}; }
};

struct ServiceSettings {
    uint64_t snapshot_interval = 1000;    // events between snapshots, 0 disables
};

struct StorageSettings {
    std::string backend = "memory";       // "memory" or "parquet"
    std::string data_directory = "data";
    uint32_t write_buffer_size = 256;
};

struct EventSettings {
    std::string format = "log";           // "log" or "json"
};

struct Settings {
    PoolSettings pool;
    ServiceSettings service;
    StorageSettings storage;
    EventSettings events;

    static Settings from_environment();
    static Settings development();
    static Settings production();
};

} // namespace amm::config
