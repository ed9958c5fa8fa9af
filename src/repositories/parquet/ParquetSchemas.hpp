#pragma once

#include <arrow/api.h>

namespace amm::repositories::pq {

class ParquetSchemas {
public:
    // Event schemas
    static std::shared_ptr<arrow::Schema> asset_registered_schema();
    static std::shared_ptr<arrow::Schema> pair_created_schema();
    static std::shared_ptr<arrow::Schema> swap_executed_schema();

    // Snapshot file schemas
    static std::shared_ptr<arrow::Schema> snapshot_manifest_schema();
    static std::shared_ptr<arrow::Schema> snapshot_assets_schema();
    static std::shared_ptr<arrow::Schema> snapshot_pairs_schema();
};

} // namespace amm::repositories::pq
