#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "field_stats.hpp"
#include "manifest_entry.hpp"
#include "row.hpp"

namespace mgen {

// Summary of a batch of manifest entries, as stored in a manifest list.
struct ManifestFileMeta {
    static constexpr uint64_t kDefaultSizePerEntry = 100;

    std::string file_name;
    uint64_t file_size{0};
    uint64_t num_added_files{0};
    uint64_t num_deleted_files{0};
    std::vector<FieldStats> partition_stats;

    /**
     * @brief Summarize a non-empty batch of entries.
     *
     * The file name is "manifest-<random uuid>" and the size is
     * `entries.size() * size_per_entry`; partition statistics are collected
     * over every entry's partition with `partition_type` as schema.
     *
     * @throws std::invalid_argument if `entries` is empty
     */
    static ManifestFileMeta Summarize(const std::vector<ManifestEntry>& entries,
                                      const RowType& partition_type,
                                      uint64_t size_per_entry = kDefaultSizePerEntry);

    nlohmann::json ToJson() const;
};

} // namespace mgen
