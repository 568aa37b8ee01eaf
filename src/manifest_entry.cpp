#include "../include/manifest_entry.hpp"

#include <map>
#include <stdexcept>
#include <utility>

namespace mgen {

ManifestEntry::ManifestEntry(ValueKind kind, Row partition, int bucket, int total_buckets,
                             DataFileMetaPtr file)
    : kind(kind),
      partition(std::move(partition)),
      bucket(bucket),
      total_buckets(total_buckets),
      file(std::move(file)) {}

ManifestEntry::Identifier ManifestEntry::GetIdentifier() const {
    return Identifier{partition, bucket, file->level, file->file_name};
}

nlohmann::json ManifestEntry::ToJson() const {
    return {
        {"kind", ValueKindName(kind)},
        {"partition", partition.ToJson()},
        {"bucket", bucket},
        {"total_buckets", total_buckets},
        {"file", file->ToJson()}
    };
}

// static
std::vector<ManifestEntry> ManifestEntry::MergeEntries(const std::vector<ManifestEntry>& entries) {
    std::map<Identifier, ManifestEntry> merged;
    for (const auto& entry : entries) {
        Identifier id = entry.GetIdentifier();
        auto it = merged.find(id);
        switch (entry.kind) {
            case ValueKind::kAdd:
                if (it != merged.end()) {
                    throw std::logic_error("Trying to add file " + id.file_name +
                                           " which is already added or deleted");
                }
                merged.emplace(std::move(id), entry);
                break;
            case ValueKind::kDelete:
                if (it == merged.end()) {
                    merged.emplace(std::move(id), entry);
                } else if (it->second.kind == ValueKind::kAdd) {
                    merged.erase(it);
                } else {
                    throw std::logic_error("Trying to delete file " + id.file_name +
                                           " which is already deleted");
                }
                break;
        }
    }

    std::vector<ManifestEntry> result;
    result.reserve(merged.size());
    for (auto& [id, entry] : merged) {
        result.push_back(std::move(entry));
    }
    return result;
}

} // namespace mgen
