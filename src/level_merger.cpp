#include "../include/level_merger.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../include/logger.hpp"

namespace mgen {

namespace {

size_t CountRecords(const Level& level) {
    size_t total = 0;
    for (const auto& file : level) {
        total += file.content.size();
    }
    return total;
}

}  // namespace

LevelMerger::LevelMerger(DataFileSupplier& supplier, int total_buckets)
    : supplier_(supplier), total_buckets_(total_buckets) {}

size_t LevelMerger::MergeLevelsIfNeeded(LevelState& state, const Row& partition, int bucket,
                                        ManifestEntryStack& out) {
    std::vector<Level>& levels = state.LevelsFor(bucket, partition);
    size_t merges = 0;

    // Each merge empties `current` and only refills `current + 1`, so levels
    // below `current` never need another look.
    for (size_t current = 0; levels[current].size() > kLevelCapacity; ++current) {
        const size_t target = current + 1;
        LevelState::EnsureLevel(levels, target);
        Level& upper = levels[current];
        Level& lower = levels[target];

        MGEN_LOG_DEBUG("compaction triggered at level %zu of partition %s bucket %d: %zu files, %zu files below",
                       current, partition.ToString().c_str(), bucket, upper.size(), lower.size());

        std::vector<KeyValue> records;
        records.reserve(CountRecords(upper) + CountRecords(lower));
        for (const auto& file : upper) {
            records.insert(records.end(), file.content.begin(), file.content.end());
        }
        for (const auto& file : lower) {
            records.insert(records.end(), file.content.begin(), file.content.end());
        }
        const size_t num_records = records.size();

        std::vector<DataFile> merged =
            supplier_.CreateDataFiles(std::move(records), target, partition, bucket);
        if (merged.empty()) {
            MGEN_LOG_ERROR("supplier returned no files for %zu records at level %zu", num_records, target);
            throw std::logic_error("Merging " + std::to_string(num_records) + " records into level " +
                                   std::to_string(target) + " produced no files");
        }
        size_t merged_records = 0;
        for (const auto& file : merged) {
            CheckMergedFile(file, target, partition, bucket);
            merged_records += file.content.size();
        }
        if (merged_records != num_records) {
            MGEN_LOG_ERROR("supplier returned %zu records for %zu merged records", merged_records, num_records);
            throw std::logic_error("Merging into level " + std::to_string(target) + " turned " +
                                   std::to_string(num_records) + " records into " +
                                   std::to_string(merged_records));
        }

        for (const auto& file : upper) {
            out.emplace(ValueKind::kDelete, partition, bucket, total_buckets_, file.meta);
        }
        upper.clear();

        for (const auto& file : lower) {
            out.emplace(ValueKind::kDelete, partition, bucket, total_buckets_, file.meta);
        }
        lower.clear();

        for (auto& file : merged) {
            out.emplace(ValueKind::kAdd, partition, bucket, total_buckets_, file.meta);
            lower.push_back(std::move(file));
        }

        MGEN_LOG_DEBUG("merged %zu records into %zu files at level %zu", num_records, lower.size(), target);
        ++merges;
    }
    return merges;
}

} // namespace mgen
