#pragma once

#include <memory>
#include <vector>

#include "data_file.hpp"
#include "key_value.hpp"
#include "options.hpp"
#include "row.hpp"

namespace mgen {

/**
 * @brief Source of data files for the manifest generator.
 *
 * Implementations decide how records are assigned to partitions and buckets.
 * The generator checks every returned file against the contract below and
 * throws std::logic_error on a violation.
 */
class DataFileSupplier {
public:
    virtual ~DataFileSupplier() = default;

    // Creates the default RandomDataFileSupplier.
    static std::unique_ptr<DataFileSupplier> Create(const GeneratorOptions& options);

    // Returns a new level-0 file with a bucket in [0, num_buckets).
    virtual DataFile NextFile() = 0;

    /**
     * @brief Re-pack merged records into files of the given level.
     *
     * Must return a non-empty list of files tagged with `level`, `partition`
     * and `bucket` that together hold every record of `records`.
     */
    virtual std::vector<DataFile> CreateDataFiles(
        std::vector<KeyValue> records,
        size_t level,
        const Row& partition,
        int bucket) = 0;
};

// Throw std::logic_error if a file from NextFile() breaks the contract above.
void CheckNewFile(const DataFile& file, int num_buckets);

// Throw std::logic_error if a file from CreateDataFiles() breaks the contract above.
void CheckMergedFile(const DataFile& file, size_t level, const Row& partition, int bucket);

} // namespace mgen
