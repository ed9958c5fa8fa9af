#include "repositories/RepositoryFactory.hpp"

#include "repositories/InMemoryPoolRepository.hpp"

#ifdef AMM_HAS_PARQUET
#include "repositories/parquet/ParquetPoolRepository.hpp"
#endif

#include <stdexcept>

namespace amm::repositories {

std::unique_ptr<IPoolRepository> make_pool_repository(const amm::config::StorageSettings& settings) {
    if (settings.backend == "memory") {
        return std::make_unique<InMemoryPoolRepository>();
    }
    if (settings.backend == "parquet") {
#ifdef AMM_HAS_PARQUET
        auto fs = pq::ParquetPoolRepository::make_local_fs(settings.data_directory);
        return std::make_unique<pq::ParquetPoolRepository>(fs, settings);
#else
        throw std::runtime_error("Parquet backend requested but not compiled in. "
                                 "Rebuild with Apache Arrow installed.");
#endif
    }
    throw std::invalid_argument("Unknown storage backend: " + settings.backend);
}

} // namespace amm::repositories
