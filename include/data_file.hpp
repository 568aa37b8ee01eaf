#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "field_stats.hpp"
#include "key_value.hpp"
#include "row.hpp"

namespace mgen {

/**
 * @brief Metadata of one immutable data file.
 *
 * Manifest entries hold it through a shared_ptr so it stays valid after the
 * file itself has been merged away.
 */
struct DataFileMeta {
    std::string file_name;
    uint64_t file_size{0};   // encoded bytes of the content
    uint64_t row_count{0};
    Row min_key;
    Row max_key;
    std::vector<FieldStats> key_stats;
    uint64_t min_sequence_number{0};
    uint64_t max_sequence_number{0};
    size_t level{0};
    uint32_t checksum{0};    // crc32 of the encoded content

    nlohmann::json ToJson() const;
};

using DataFileMetaPtr = std::shared_ptr<const DataFileMeta>;

// A data file as handed out by a DataFileSupplier.
struct DataFile {
    Row partition;
    int bucket{0};
    DataFileMetaPtr meta;
    std::vector<KeyValue> content;

    size_t Level() const { return meta->level; }
    const std::string& FileName() const { return meta->file_name; }
};

} // namespace mgen
