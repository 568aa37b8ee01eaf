#include "../include/manifest_file_meta.hpp"

#include <stdexcept>

#include "../include/uuid.hpp"

namespace mgen {

// static
ManifestFileMeta ManifestFileMeta::Summarize(const std::vector<ManifestEntry>& entries,
                                             const RowType& partition_type,
                                             uint64_t size_per_entry) {
    if (entries.empty()) {
        throw std::invalid_argument("Manifest entries are empty. Invalid test data.");
    }

    FieldStatsCollector collector(partition_type);
    ManifestFileMeta meta;
    for (const auto& entry : entries) {
        collector.Collect(entry.partition);
        if (entry.kind == ValueKind::kAdd) {
            meta.num_added_files++;
        } else {
            meta.num_deleted_files++;
        }
    }

    meta.file_name = "manifest-" + RandomUuid();
    meta.file_size = entries.size() * size_per_entry;
    meta.partition_stats = collector.Extract();
    return meta;
}

nlohmann::json ManifestFileMeta::ToJson() const {
    nlohmann::json stats = nlohmann::json::array();
    for (const auto& s : partition_stats) {
        stats.push_back(s.ToJson());
    }
    return {
        {"file_name", file_name},
        {"file_size", file_size},
        {"num_added_files", num_added_files},
        {"num_deleted_files", num_deleted_files},
        {"partition_stats", stats}
    };
}

} // namespace mgen
