#include "repositories/parquet/ParquetPoolRepository.hpp"
#include "repositories/parquet/ParquetSchemas.hpp"

#include <arrow/filesystem/localfs.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>
#include <parquet/exception.h>

#include <algorithm>
#include <charconv>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <variant>

using namespace amm::domain;

namespace amm::repositories::pq {

namespace {

const char* const kAssetRegistered = "asset_registered";
const char* const kPairCreated = "pair_created";
const char* const kSwapExecuted = "swap_executed";
const char* const kManifestPath = "snapshots/manifest.parquet";

std::string event_type_of(const PoolEventVariant& event) {
    return std::visit([](const auto& e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, AssetRegistered>) {
            return kAssetRegistered;
        } else if constexpr (std::is_same_v<T, PairCreated>) {
            return kPairCreated;
        } else {
            return kSwapExecuted;
        }
    }, event);
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size()) return false;
    return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Extract filename stem from a path string (no directory, no extension)
std::string stem(const std::string& path) {
    auto slash = path.rfind('/');
    std::string filename = (slash == std::string::npos) ? path : path.substr(slash + 1);
    auto dot = filename.rfind('.');
    if (dot == std::string::npos) return filename;
    return filename.substr(0, dot);
}

// Last sequence number in a file named {event_type}_{seq_start}_{seq_end}
std::optional<uint64_t> seq_end_of(const std::string& path) {
    auto name = stem(path);
    auto underscore = name.rfind('_');
    if (underscore == std::string::npos) return std::nullopt;
    uint64_t value = 0;
    const char* first = name.data() + underscore + 1;
    const char* last = name.data() + name.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) return std::nullopt;
    return value;
}

std::shared_ptr<arrow::Array> finish(arrow::ArrayBuilder& builder) {
    std::shared_ptr<arrow::Array> array;
    PARQUET_THROW_NOT_OK(builder.Finish(&array));
    return array;
}

template <typename ArrayType>
std::shared_ptr<ArrayType> column(const arrow::Table& table, const std::string& name) {
    auto chunked = table.GetColumnByName(name);
    if (!chunked || chunked->num_chunks() == 0) {
        throw std::runtime_error("Parquet table has no column " + name);
    }
    return std::static_pointer_cast<ArrayType>(chunked->chunk(0));
}

Amount amount_at(const arrow::StringArray& array, int64_t i) {
    return Amount::from_string(array.GetString(i));
}

} // namespace

ParquetPoolRepository::ParquetPoolRepository(
    std::shared_ptr<arrow::fs::FileSystem> fs,
    const amm::config::StorageSettings& settings)
    : fs_(std::move(fs))
    , settings_(settings)
    , last_flush_time_(std::chrono::steady_clock::now()) {
}

ParquetPoolRepository::~ParquetPoolRepository() {
    std::lock_guard lock(mutex_);
    try {
        flush_locked();
    } catch (const std::exception& e) {
        std::cerr << "[store] Flush on close failed, "
                  << asset_buffer_.size() + pair_buffer_.size() + swap_buffer_.size()
                  << " buffered event(s) not written: " << e.what() << std::endl;
    }
}

std::shared_ptr<arrow::fs::FileSystem> ParquetPoolRepository::make_local_fs(
    const std::string& root_dir) {
    auto local = std::make_shared<arrow::fs::LocalFileSystem>();
    PARQUET_THROW_NOT_OK(local->CreateDir(root_dir, /*recursive=*/true));
    return std::make_shared<arrow::fs::SubTreeFileSystem>(root_dir, local);
}

void ParquetPoolRepository::append_event(const PoolEventVariant& event) {
    std::lock_guard lock(mutex_);

    auto event_type = event_type_of(event);
    auto& buffer = event_type == kAssetRegistered ? asset_buffer_
                 : event_type == kPairCreated ? pair_buffer_
                 : swap_buffer_;
    buffer.push_back(event);

    try {
        maybe_flush();
    } catch (const std::exception&) {
        // flush_locked() writes this event's buffer last, so a failure means
        // the event never reached storage.
        buffer.pop_back();
        throw;
    }
}

void ParquetPoolRepository::flush() {
    std::lock_guard lock(mutex_);
    flush_locked();
}

void ParquetPoolRepository::maybe_flush() {
    size_t total = asset_buffer_.size() + pair_buffer_.size() + swap_buffer_.size();

    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        now - last_flush_time_).count();

    if (total >= static_cast<size_t>(std::max<uint32_t>(1, settings_.write_buffer_size)) || elapsed >= 30) {
        flush_locked();
    }
}

void ParquetPoolRepository::flush_locked() {
    // Oldest-first by the sequence number at the tail of each buffer, so the
    // buffer holding the newest event is written last.
    std::vector<std::pair<std::string, std::vector<PoolEventVariant>*>> buffers = {
        {kAssetRegistered, &asset_buffer_},
        {kPairCreated, &pair_buffer_},
        {kSwapExecuted, &swap_buffer_},
    };
    auto tail_seq = [](const std::vector<PoolEventVariant>* buffer) -> uint64_t {
        return buffer->empty() ? 0 : sequence_number_of(buffer->back());
    };
    std::sort(buffers.begin(), buffers.end(), [&](const auto& a, const auto& b) {
        return tail_seq(a.second) < tail_seq(b.second);
    });

    for (auto& [event_type, buffer] : buffers) {
        if (buffer->empty()) continue;
        flush_buffer(event_type, *buffer);
        buffer->clear();
    }
    last_flush_time_ = std::chrono::steady_clock::now();
}

void ParquetPoolRepository::flush_buffer(
    const std::string& event_type,
    const std::vector<PoolEventVariant>& events) {
    if (events.empty()) return;

    uint64_t seq_start = sequence_number_of(events.front());
    uint64_t seq_end = sequence_number_of(events.back());

    std::string dir = events_dir(event_type);
    PARQUET_THROW_NOT_OK(fs_->CreateDir(dir, /*recursive=*/true));

    std::string path = dir + "/" + event_type + "_" + std::to_string(seq_start) + "_"
        + std::to_string(seq_end) + ".parquet";

    if (event_type == kAssetRegistered) {
        write_asset_registered(path, events);
    } else if (event_type == kPairCreated) {
        write_pair_created(path, events);
    } else if (event_type == kSwapExecuted) {
        write_swap_executed(path, events);
    }
}

// --- Write helpers ---

void ParquetPoolRepository::write_asset_registered(
    const std::string& path,
    const std::vector<PoolEventVariant>& events) {

    arrow::UInt64Builder seq_builder;
    arrow::StringBuilder asset_builder;

    for (const auto& event : events) {
        const auto& registered = std::get<AssetRegistered>(event);
        PARQUET_THROW_NOT_OK(seq_builder.Append(registered.sequence_number));
        PARQUET_THROW_NOT_OK(asset_builder.Append(registered.asset.id()));
    }

    auto table = arrow::Table::Make(ParquetSchemas::asset_registered_schema(),
        {finish(seq_builder), finish(asset_builder)});
    write_table(path, *table);
}

void ParquetPoolRepository::write_pair_created(
    const std::string& path,
    const std::vector<PoolEventVariant>& events) {

    arrow::UInt64Builder seq_builder;
    arrow::StringBuilder low_builder, high_builder, creator_builder;
    arrow::StringBuilder reserve_low_builder, reserve_high_builder;

    for (const auto& event : events) {
        const auto& created = std::get<PairCreated>(event);
        PARQUET_THROW_NOT_OK(seq_builder.Append(created.sequence_number));
        PARQUET_THROW_NOT_OK(low_builder.Append(created.key.low().id()));
        PARQUET_THROW_NOT_OK(high_builder.Append(created.key.high().id()));
        PARQUET_THROW_NOT_OK(creator_builder.Append(created.creator.id()));
        PARQUET_THROW_NOT_OK(reserve_low_builder.Append(created.reserve_low.to_string()));
        PARQUET_THROW_NOT_OK(reserve_high_builder.Append(created.reserve_high.to_string()));
    }

    auto table = arrow::Table::Make(ParquetSchemas::pair_created_schema(),
        {finish(seq_builder), finish(low_builder), finish(high_builder),
         finish(creator_builder), finish(reserve_low_builder), finish(reserve_high_builder)});
    write_table(path, *table);
}

void ParquetPoolRepository::write_swap_executed(
    const std::string& path,
    const std::vector<PoolEventVariant>& events) {

    arrow::UInt64Builder seq_builder;
    arrow::StringBuilder low_builder, high_builder, caller_builder;
    arrow::StringBuilder low_in_builder, high_in_builder, low_out_builder, high_out_builder;

    for (const auto& event : events) {
        const auto& swap = std::get<SwapExecuted>(event);
        PARQUET_THROW_NOT_OK(seq_builder.Append(swap.sequence_number));
        PARQUET_THROW_NOT_OK(low_builder.Append(swap.key.low().id()));
        PARQUET_THROW_NOT_OK(high_builder.Append(swap.key.high().id()));
        PARQUET_THROW_NOT_OK(caller_builder.Append(swap.caller.id()));
        PARQUET_THROW_NOT_OK(low_in_builder.Append(swap.amount_low_in.to_string()));
        PARQUET_THROW_NOT_OK(high_in_builder.Append(swap.amount_high_in.to_string()));
        PARQUET_THROW_NOT_OK(low_out_builder.Append(swap.amount_low_out.to_string()));
        PARQUET_THROW_NOT_OK(high_out_builder.Append(swap.amount_high_out.to_string()));
    }

    auto table = arrow::Table::Make(ParquetSchemas::swap_executed_schema(),
        {finish(seq_builder), finish(low_builder), finish(high_builder), finish(caller_builder),
         finish(low_in_builder), finish(high_in_builder),
         finish(low_out_builder), finish(high_out_builder)});
    write_table(path, *table);
}

// Writes to a ".tmp" sibling and renames it into place, so a reader never
// sees a partially written file under the final name.
void ParquetPoolRepository::write_table(const std::string& path, const arrow::Table& table) const {
    std::string tmp_path = path + ".tmp";
    try {
        {
            PARQUET_ASSIGN_OR_THROW(auto outfile, fs_->OpenOutputStream(tmp_path));
            PARQUET_THROW_NOT_OK(::parquet::arrow::WriteTable(
                table, arrow::default_memory_pool(), outfile,
                std::max<int64_t>(1, table.num_rows())));
            PARQUET_THROW_NOT_OK(outfile->Close());
        }
        PARQUET_THROW_NOT_OK(fs_->Move(tmp_path, path));
    } catch (const std::exception&) {
        auto info = fs_->GetFileInfo(tmp_path);
        if (info.ok() && info->type() != arrow::fs::FileType::NotFound) {
            auto status = fs_->DeleteFile(tmp_path);
            if (!status.ok()) {
                std::cerr << "[store] Could not remove " << tmp_path << ": "
                          << status.ToString() << std::endl;
            }
        }
        throw;
    }
}

std::shared_ptr<arrow::Table> ParquetPoolRepository::read_table(const std::string& path) const {
    PARQUET_ASSIGN_OR_THROW(auto infile, fs_->OpenInputFile(path));
    std::unique_ptr<::parquet::arrow::FileReader> reader;
    PARQUET_ASSIGN_OR_THROW(reader, ::parquet::arrow::FileReader::Make(
        arrow::default_memory_pool(), ::parquet::ParquetFileReader::Open(infile)));

    std::shared_ptr<arrow::Table> table;
    PARQUET_THROW_NOT_OK(reader->ReadTable(&table));
    PARQUET_ASSIGN_OR_THROW(auto combined, table->CombineChunks());
    return combined;
}

// --- Read path ---

std::vector<PoolEventVariant> ParquetPoolRepository::get_events_since(
    uint64_t sequence_number) const {
    std::lock_guard lock(mutex_);

    std::vector<PoolEventVariant> result;

    for (const char* event_type : {kAssetRegistered, kPairCreated, kSwapExecuted}) {
        auto disk_events = read_events_from_directory(event_type, sequence_number);
        result.insert(result.end(), disk_events.begin(), disk_events.end());
    }

    // Merge with unflushed buffers
    auto merge_buffer = [&](const std::vector<PoolEventVariant>& buffer) {
        for (const auto& event : buffer) {
            if (sequence_number_of(event) > sequence_number) {
                result.push_back(event);
            }
        }
    };
    merge_buffer(asset_buffer_);
    merge_buffer(pair_buffer_);
    merge_buffer(swap_buffer_);

    std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
        return sequence_number_of(a) < sequence_number_of(b);
    });

    return result;
}

std::vector<PoolEventVariant> ParquetPoolRepository::read_events_from_directory(
    const std::string& event_type, uint64_t min_sequence) const {

    std::vector<PoolEventVariant> result;

    arrow::fs::FileSelector selector;
    selector.base_dir = events_dir(event_type);
    selector.allow_not_found = true;
    selector.recursive = false;
    PARQUET_ASSIGN_OR_THROW(auto listing, fs_->GetFileInfo(selector));

    for (const auto& file_info : listing) {
        if (file_info.type() != arrow::fs::FileType::File) continue;
        if (!ends_with(file_info.path(), ".parquet")) continue;

        // Skip files that end at or before the requested sequence number
        auto seq_end = seq_end_of(file_info.path());
        if (seq_end && *seq_end <= min_sequence) continue;

        auto table = read_table(file_info.path());
        if (table->num_rows() == 0) continue;

        auto seq_col = column<arrow::UInt64Array>(*table, "sequence_number");

        if (event_type == kAssetRegistered) {
            auto asset_col = column<arrow::StringArray>(*table, "asset");
            for (int64_t i = 0; i < table->num_rows(); ++i) {
                if (seq_col->Value(i) <= min_sequence) continue;
                result.push_back(AssetRegistered{{seq_col->Value(i)}, Asset(asset_col->GetString(i))});
            }

        } else if (event_type == kPairCreated) {
            auto low_col = column<arrow::StringArray>(*table, "asset_low");
            auto high_col = column<arrow::StringArray>(*table, "asset_high");
            auto creator_col = column<arrow::StringArray>(*table, "creator");
            auto reserve_low_col = column<arrow::StringArray>(*table, "reserve_low");
            auto reserve_high_col = column<arrow::StringArray>(*table, "reserve_high");
            for (int64_t i = 0; i < table->num_rows(); ++i) {
                if (seq_col->Value(i) <= min_sequence) continue;
                result.push_back(PairCreated{
                    {seq_col->Value(i)},
                    PairKey::of(Asset(low_col->GetString(i)), Asset(high_col->GetString(i))),
                    Account(creator_col->GetString(i)),
                    amount_at(*reserve_low_col, i),
                    amount_at(*reserve_high_col, i),
                });
            }

        } else if (event_type == kSwapExecuted) {
            auto low_col = column<arrow::StringArray>(*table, "asset_low");
            auto high_col = column<arrow::StringArray>(*table, "asset_high");
            auto caller_col = column<arrow::StringArray>(*table, "caller");
            auto low_in_col = column<arrow::StringArray>(*table, "amount_low_in");
            auto high_in_col = column<arrow::StringArray>(*table, "amount_high_in");
            auto low_out_col = column<arrow::StringArray>(*table, "amount_low_out");
            auto high_out_col = column<arrow::StringArray>(*table, "amount_high_out");
            for (int64_t i = 0; i < table->num_rows(); ++i) {
                if (seq_col->Value(i) <= min_sequence) continue;
                result.push_back(SwapExecuted{
                    {seq_col->Value(i)},
                    PairKey::of(Asset(low_col->GetString(i)), Asset(high_col->GetString(i))),
                    Account(caller_col->GetString(i)),
                    amount_at(*low_in_col, i),
                    amount_at(*high_in_col, i),
                    amount_at(*low_out_col, i),
                    amount_at(*high_out_col, i),
                });
            }
        }
    }

    return result;
}

// --- Snapshot storage ---

void ParquetPoolRepository::store_snapshot(const PoolSnapshot& snapshot) {
    std::lock_guard lock(mutex_);

    auto previous = read_manifest_sequence();
    std::string dir = snapshot_dir(snapshot.last_sequence_number);
    PARQUET_THROW_NOT_OK(fs_->CreateDir(dir, /*recursive=*/true));

    try {
        write_snapshot_files(dir, snapshot);
    } catch (const std::exception&) {
        if (!previous || *previous != snapshot.last_sequence_number) {
            auto status = fs_->DeleteDir(dir);
            if (!status.ok()) {
                std::cerr << "[store] Could not remove " << dir << ": "
                          << status.ToString() << std::endl;
            }
        }
        throw;
    }

    if (previous && *previous != snapshot.last_sequence_number) {
        PARQUET_THROW_NOT_OK(fs_->DeleteDir(snapshot_dir(*previous)));
    }
}

void ParquetPoolRepository::write_snapshot_files(const std::string& dir,
                                                 const PoolSnapshot& snapshot) {
    arrow::StringBuilder asset_builder;
    for (const auto& asset : snapshot.assets) {
        PARQUET_THROW_NOT_OK(asset_builder.Append(asset.id()));
    }
    write_table(dir + "/assets.parquet", *arrow::Table::Make(
        ParquetSchemas::snapshot_assets_schema(), {finish(asset_builder)}));

    arrow::StringBuilder low_builder, high_builder, reserve_low_builder, reserve_high_builder;
    for (const auto& pair : snapshot.pairs) {
        PARQUET_THROW_NOT_OK(low_builder.Append(pair.asset_low().id()));
        PARQUET_THROW_NOT_OK(high_builder.Append(pair.asset_high().id()));
        PARQUET_THROW_NOT_OK(reserve_low_builder.Append(pair.reserve_low().to_string()));
        PARQUET_THROW_NOT_OK(reserve_high_builder.Append(pair.reserve_high().to_string()));
    }
    write_table(dir + "/pairs.parquet", *arrow::Table::Make(
        ParquetSchemas::snapshot_pairs_schema(),
        {finish(low_builder), finish(high_builder),
         finish(reserve_low_builder), finish(reserve_high_builder)}));

    // The manifest is written last; it switches readers to the new directory.
    arrow::UInt64Builder seq_builder, asset_count_builder, pair_count_builder;
    PARQUET_THROW_NOT_OK(seq_builder.Append(snapshot.last_sequence_number));
    PARQUET_THROW_NOT_OK(asset_count_builder.Append(snapshot.assets.size()));
    PARQUET_THROW_NOT_OK(pair_count_builder.Append(snapshot.pairs.size()));
    write_table(kManifestPath, *arrow::Table::Make(
        ParquetSchemas::snapshot_manifest_schema(),
        {finish(seq_builder), finish(asset_count_builder), finish(pair_count_builder)}));
}

std::optional<uint64_t> ParquetPoolRepository::read_manifest_sequence() const {
    PARQUET_ASSIGN_OR_THROW(auto info, fs_->GetFileInfo(kManifestPath));
    if (info.type() == arrow::fs::FileType::NotFound) return std::nullopt;

    auto manifest = read_table(kManifestPath);
    if (manifest->num_rows() == 0) return std::nullopt;
    return column<arrow::UInt64Array>(*manifest, "sequence_number")->Value(0);
}

std::optional<PoolSnapshot> ParquetPoolRepository::get_latest_snapshot() const {
    std::lock_guard lock(mutex_);

    PARQUET_ASSIGN_OR_THROW(auto info, fs_->GetFileInfo(kManifestPath));
    if (info.type() == arrow::fs::FileType::NotFound) return std::nullopt;

    auto manifest = read_table(kManifestPath);
    if (manifest->num_rows() == 0) return std::nullopt;

    PoolSnapshot snapshot{column<arrow::UInt64Array>(*manifest, "sequence_number")->Value(0), {}, {}};
    auto asset_count = column<arrow::UInt64Array>(*manifest, "asset_count")->Value(0);
    auto pair_count = column<arrow::UInt64Array>(*manifest, "pair_count")->Value(0);
    std::string dir = snapshot_dir(snapshot.last_sequence_number);

    auto assets = read_table(dir + "/assets.parquet");
    if (assets->num_rows() > 0) {
        auto asset_col = column<arrow::StringArray>(*assets, "asset");
        for (int64_t i = 0; i < assets->num_rows(); ++i) {
            snapshot.assets.emplace_back(asset_col->GetString(i));
        }
    }

    auto pairs = read_table(dir + "/pairs.parquet");
    if (pairs->num_rows() > 0) {
        auto low_col = column<arrow::StringArray>(*pairs, "asset_low");
        auto high_col = column<arrow::StringArray>(*pairs, "asset_high");
        auto reserve_low_col = column<arrow::StringArray>(*pairs, "reserve_low");
        auto reserve_high_col = column<arrow::StringArray>(*pairs, "reserve_high");
        for (int64_t i = 0; i < pairs->num_rows(); ++i) {
            snapshot.pairs.push_back(Pair::create(
                PairKey::of(Asset(low_col->GetString(i)), Asset(high_col->GetString(i))),
                amount_at(*reserve_low_col, i),
                amount_at(*reserve_high_col, i)));
        }
    }

    if (snapshot.assets.size() != asset_count || snapshot.pairs.size() != pair_count) {
        throw std::runtime_error("Snapshot #" + std::to_string(snapshot.last_sequence_number)
                                 + " does not match its manifest");
    }
    return snapshot;
}

// --- Path helpers ---

std::string ParquetPoolRepository::events_dir(const std::string& event_type) {
    return "events/" + event_type;
}

std::string ParquetPoolRepository::snapshot_dir(uint64_t sequence_number) {
    std::ostringstream oss;
    oss << "snapshots/" << std::setfill('0') << std::setw(20) << sequence_number;
    return oss.str();
}

} // namespace amm::repositories::pq
