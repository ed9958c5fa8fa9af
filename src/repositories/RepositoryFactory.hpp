#pragma once

#include "config/Settings.hpp"
#include "repositories/IPoolRepository.hpp"

#include <memory>

namespace amm::repositories {

// "memory" or "parquet"; the latter requires a build with Apache Arrow.
std::unique_ptr<IPoolRepository> make_pool_repository(const amm::config::StorageSettings& settings);

} // namespace amm::repositories
