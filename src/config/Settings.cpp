#include "config/Settings.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace amm::config {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

// Non-negative integer in [0, max]; anything else keeps the fallback
uint64_t env_uint_or(const char* name, uint64_t fallback,
                     uint64_t max = std::numeric_limits<uint64_t>::max()) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    long long parsed = 0;
    try {
        parsed = std::stoll(val);
    } catch (const std::logic_error&) {
        return fallback;
    }
    if (parsed < 0 || static_cast<unsigned long long>(parsed) > max) return fallback;
    return static_cast<uint64_t>(parsed);
}

uint32_t env_uint32_or(const char* name, uint32_t fallback) {
    return static_cast<uint32_t>(
        env_uint_or(name, fallback, std::numeric_limits<uint32_t>::max()));
}

} // namespace

Settings Settings::from_environment() {
    std::string env = env_or("AMM_ENV", "development");
    Settings s = (env == "production") ? production() : development();
    s.pool.custody_account = env_or("AMM_CUSTODY_ACCOUNT", s.pool.custody_account);
    s.pool.fee_numerator = env_uint32_or("AMM_FEE_NUMERATOR", s.pool.fee_numerator);
    s.pool.fee_denominator = env_uint32_or("AMM_FEE_DENOMINATOR", s.pool.fee_denominator);
    s.service.snapshot_interval = env_uint_or("AMM_SNAPSHOT_INTERVAL", s.service.snapshot_interval);
    s.storage.backend = env_or("AMM_STORAGE_BACKEND", s.storage.backend);
    s.storage.data_directory = env_or("AMM_DATA_DIRECTORY", s.storage.data_directory);
    s.storage.write_buffer_size = env_uint32_or("AMM_WRITE_BUFFER_SIZE", s.storage.write_buffer_size);
    s.events.format = env_or("AMM_EVENT_FORMAT", s.events.format);
    return s;
}

Settings Settings::development() {
    Settings s;
    s.storage.data_directory = "data/dev";
    return s;
}

Settings Settings::production() {
    Settings s;
    s.service.snapshot_interval = 100;
    s.storage.backend = "parquet";
    s.storage.data_directory = "data/prod";
    s.storage.write_buffer_size = 1;
    s.events.format = "json";
    return s;
}

} // namespace amm::config
