#include "repositories/parquet/ParquetSchemas.hpp"

namespace amm::repositories::pq {

namespace {

// Amounts are 256-bit; they are stored as decimal strings.
std::shared_ptr<arrow::Field> amount_field(const std::string& name) {
    return arrow::field(name, arrow::utf8(), /*nullable=*/false);
}

arrow::FieldVector base_event_fields() {
    return {
        arrow::field("sequence_number", arrow::uint64(), /*nullable=*/false),
    };
}

arrow::FieldVector extend(arrow::FieldVector base, arrow::FieldVector extra) {
    base.insert(base.end(), extra.begin(), extra.end());
    return base;
}

} // namespace

std::shared_ptr<arrow::Schema> ParquetSchemas::asset_registered_schema() {
    return arrow::schema(extend(base_event_fields(), {
        arrow::field("asset", arrow::utf8(), false),
    }));
}

std::shared_ptr<arrow::Schema> ParquetSchemas::pair_created_schema() {
    return arrow::schema(extend(base_event_fields(), {
        arrow::field("asset_low", arrow::utf8(), false),
        arrow::field("asset_high", arrow::utf8(), false),
        arrow::field("creator", arrow::utf8(), false),
        amount_field("reserve_low"),
        amount_field("reserve_high"),
    }));
}

std::shared_ptr<arrow::Schema> ParquetSchemas::swap_executed_schema() {
    return arrow::schema(extend(base_event_fields(), {
        arrow::field("asset_low", arrow::utf8(), false),
        arrow::field("asset_high", arrow::utf8(), false),
        arrow::field("caller", arrow::utf8(), false),
        amount_field("amount_low_in"),
        amount_field("amount_high_in"),
        amount_field("amount_low_out"),
        amount_field("amount_high_out"),
    }));
}

std::shared_ptr<arrow::Schema> ParquetSchemas::snapshot_manifest_schema() {
    return arrow::schema({
        arrow::field("sequence_number", arrow::uint64(), false),
        arrow::field("asset_count", arrow::uint64(), false),
        arrow::field("pair_count", arrow::uint64(), false),
    });
}

std::shared_ptr<arrow::Schema> ParquetSchemas::snapshot_assets_schema() {
    return arrow::schema({
        arrow::field("asset", arrow::utf8(), false),
    });
}

std::shared_ptr<arrow::Schema> ParquetSchemas::snapshot_pairs_schema() {
    return arrow::schema({
        arrow::field("asset_low", arrow::utf8(), false),
        arrow::field("asset_high", arrow::utf8(), false),
        amount_field("reserve_low"),
        amount_field("reserve_high"),
    });
}

} // namespace amm::repositories::pq
