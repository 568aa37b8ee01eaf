#pragma once

#include <cstdint>
#include <map>
#include <random>
#include <utility>
#include <vector>

#include "data_file_supplier.hpp"
#include "key_value_generator.hpp"
#include "options.hpp"

namespace mgen {

/**
 * @brief Default supplier: random records buffered per (partition, bucket).
 *
 * Each record goes to the mem table of its partition and of bucket
 * `key.HashCode() % num_buckets`. A mem table reaching `mem_table_capacity`
 * records is turned into one level-0 file. With a fixed seed the produced
 * files, file names included, are identical from run to run.
 */
class RandomDataFileSupplier final : public DataFileSupplier {
public:
    explicit RandomDataFileSupplier(const GeneratorOptions& options);

    DataFile NextFile() override;

    // Sorts `records` by key and sequence number and splits them into files of
    // at most mem_table_capacity^(level+1) records.
    std::vector<DataFile> CreateDataFiles(
        std::vector<KeyValue> records,
        size_t level,
        const Row& partition,
        int bucket) override;

    // Records generated but not yet handed out in a file.
    size_t BufferedRecords() const;

    // Maximum records per file at `level`.
    size_t FileCapacity(size_t level) const;

private:
    DataFile CreateDataFile(std::vector<KeyValue> records, size_t level,
                            const Row& partition, int bucket);

    int num_buckets_;
    size_t mem_table_capacity_;
    KeyValueGenerator kv_gen_;
    std::mt19937_64 name_rng_;

    // Ordered so that flush order never depends on hashing.
    std::map<std::pair<Row, int>, std::vector<KeyValue>> mem_tables_;
};

} // namespace mgen
