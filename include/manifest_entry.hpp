#pragma once

#include <stack>
#include <string>
#include <tuple>
#include <vector>

#include <nlohmann/json.hpp>

#include "data_file.hpp"
#include "key_value.hpp"
#include "row.hpp"

namespace mgen {

/**
 * @brief Addition or removal of one data file in a (partition, bucket).
 *
 * `total_buckets` is the configured bucket count, copied into every entry.
 */
struct ManifestEntry {
    // Identifies the file an entry refers to, regardless of its kind.
    struct Identifier {
        Row partition;
        int bucket;
        size_t level;
        std::string file_name;

        bool operator<(const Identifier& other) const {
            return std::tie(partition, bucket, level, file_name) <
                   std::tie(other.partition, other.bucket, other.level, other.file_name);
        }
        bool operator==(const Identifier& other) const {
            return std::tie(partition, bucket, level, file_name) ==
                   std::tie(other.partition, other.bucket, other.level, other.file_name);
        }
    };

    ValueKind kind;
    Row partition;
    int bucket;
    int total_buckets;
    DataFileMetaPtr file;

    ManifestEntry(ValueKind kind, Row partition, int bucket, int total_buckets, DataFileMetaPtr file);

    Identifier GetIdentifier() const;

    nlohmann::json ToJson() const;

    /**
     * @brief Fold an ordered sequence of entries into its net effect.
     *
     * ADD makes a file live, DELETE of a live file cancels it, DELETE of a
     * file not seen in `entries` is kept (it removes a file added by an
     * earlier batch). The result is ordered by identifier.
     *
     * ManifestTestDataGenerator::Next() hands out each step newest first, so
     * reverse every step's entries back into emission order before merging.
     *
     * @throws std::logic_error on ADD of a file that is already known, or a
     *         second DELETE of the same file
     */
    static std::vector<ManifestEntry> MergeEntries(const std::vector<ManifestEntry>& entries);
};

// Pending entries of a generation step, handed out newest first.
using ManifestEntryStack = std::stack<ManifestEntry, std::vector<ManifestEntry>>;

} // namespace mgen
