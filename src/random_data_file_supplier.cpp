#include "../include/random_data_file_supplier.hpp"

#include <zlib.h>

#include <algorithm>
#include <limits>
#include <memory>
#include <stdexcept>

#include "../include/field_stats.hpp"
#include "../include/logger.hpp"
#include "../include/uuid.hpp"

namespace mgen {

namespace {

uint64_t SeedFrom(const GeneratorOptions& options) {
    if (options.seed.has_value()) {
        return *options.seed;
    }
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) ^ rd();
}

// Distinct streams for record contents and file names.
constexpr uint64_t kNameStreamSalt = 0x9E3779B97F4A7C15ULL;

}  // namespace

RandomDataFileSupplier::RandomDataFileSupplier(const GeneratorOptions& options)
    : num_buckets_(options.num_buckets),
      mem_table_capacity_(options.mem_table_capacity),
      kv_gen_(0),
      name_rng_(0) {
    options.Validate();
    uint64_t seed = SeedFrom(options);
    kv_gen_ = KeyValueGenerator(seed);
    name_rng_.seed(seed ^ kNameStreamSalt);
}

DataFile RandomDataFileSupplier::NextFile() {
    while (true) {
        KeyValue kv = kv_gen_.Next();
        Row partition = KeyValueGenerator::GetPartition(kv);
        int bucket = static_cast<int>(kv.key.HashCode() % static_cast<uint32_t>(num_buckets_));

        auto key = std::make_pair(std::move(partition), bucket);
        auto& mem_table = mem_tables_[key];
        mem_table.push_back(std::move(kv));
        if (mem_table.size() < mem_table_capacity_) {
            continue;
        }

        std::vector<KeyValue> records = std::move(mem_table);
        mem_tables_.erase(key);
        MGEN_LOG_DEBUG("flush mem table of partition %s bucket %d (%zu records)",
                       key.first.ToString().c_str(), bucket, records.size());
        return CreateDataFile(std::move(records), 0, key.first, bucket);
    }
}

std::vector<DataFile> RandomDataFileSupplier::CreateDataFiles(
    std::vector<KeyValue> records,
    size_t level,
    const Row& partition,
    int bucket) {
    if (records.empty()) {
        throw std::logic_error("Cannot create data files from an empty record set");
    }

    std::stable_sort(records.begin(), records.end(), KeyValueOrder{});

    const size_t capacity = FileCapacity(level);
    std::vector<DataFile> result;
    for (size_t start = 0; start < records.size(); start += capacity) {
        size_t end = std::min(records.size(), start + capacity);
        std::vector<KeyValue> chunk(std::make_move_iterator(records.begin() + start),
                                    std::make_move_iterator(records.begin() + end));
        result.push_back(CreateDataFile(std::move(chunk), level, partition, bucket));
        if (end == records.size()) {
            break;
        }
    }
    return result;
}

size_t RandomDataFileSupplier::BufferedRecords() const {
    size_t total = 0;
    for (const auto& [key, mem_table] : mem_tables_) {
        total += mem_table.size();
    }
    return total;
}

size_t RandomDataFileSupplier::FileCapacity(size_t level) const {
    size_t capacity = mem_table_capacity_;
    for (size_t i = 0; i < level; ++i) {
        if (capacity > std::numeric_limits<size_t>::max() / mem_table_capacity_) {
            return std::numeric_limits<size_t>::max();
        }
        capacity *= mem_table_capacity_;
    }
    return capacity;
}

DataFile RandomDataFileSupplier::CreateDataFile(std::vector<KeyValue> records, size_t level,
                                                const Row& partition, int bucket) {
    std::stable_sort(records.begin(), records.end(), KeyValueOrder{});

    auto meta = std::make_shared<DataFileMeta>();
    meta->file_name = "sst-" + RandomUuid(name_rng_);
    meta->row_count = records.size();
    meta->level = level;

    FieldStatsCollector key_stats(KeyValueGenerator::KeyType());
    std::vector<uint8_t> encoded;
    uLong crc = crc32(0L, Z_NULL, 0);
    meta->min_sequence_number = std::numeric_limits<uint64_t>::max();
    for (const auto& kv : records) {
        key_stats.Collect(kv.key);
        encoded.clear();
        kv.EncodeTo(encoded);
        crc = crc32(crc, encoded.data(), static_cast<uInt>(encoded.size()));
        meta->file_size += encoded.size();
        meta->min_sequence_number = std::min(meta->min_sequence_number, kv.sequence_number);
        meta->max_sequence_number = std::max(meta->max_sequence_number, kv.sequence_number);
    }
    if (records.empty()) {
        meta->min_sequence_number = 0;
    } else {
        meta->min_key = records.front().key;
        meta->max_key = records.back().key;
    }
    meta->key_stats = key_stats.Extract();
    meta->checksum = static_cast<uint32_t>(crc);

    DataFile file;
    file.partition = partition;
    file.bucket = bucket;
    file.meta = std::move(meta);
    file.content = std::move(records);
    return file;
}

} // namespace mgen
