#include "../include/level_state.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace mgen {

LevelState::LevelState(int num_buckets) {
    if (num_buckets <= 0) {
        throw std::invalid_argument("num_buckets must be positive, got " + std::to_string(num_buckets));
    }
    buckets_.resize(static_cast<size_t>(num_buckets));
}

void LevelState::RecordNewFile(DataFile file) {
    auto& levels = Bucket(file.bucket)[file.partition];
    size_t level = file.Level();
    EnsureLevel(levels, level);
    levels[level].push_back(std::move(file));
}

std::vector<Level>& LevelState::LevelsFor(int bucket, const Row& partition) {
    auto& partitions = Bucket(bucket);
    auto it = partitions.find(partition);
    if (it == partitions.end()) {
        throw std::out_of_range("No files recorded for partition " + partition.ToString() +
                                " in bucket " + std::to_string(bucket));
    }
    return it->second;
}

const std::vector<Level>& LevelState::LevelsFor(int bucket, const Row& partition) const {
    const auto& partitions = Bucket(bucket);
    auto it = partitions.find(partition);
    if (it == partitions.end()) {
        throw std::out_of_range("No files recorded for partition " + partition.ToString() +
                                " in bucket " + std::to_string(bucket));
    }
    return it->second;
}

// static
void LevelState::EnsureLevel(std::vector<Level>& levels, size_t level) {
    while (levels.size() <= level) {
        levels.emplace_back();
    }
}

bool LevelState::Contains(int bucket, const Row& partition) const {
    const auto& partitions = Bucket(bucket);
    return partitions.find(partition) != partitions.end();
}

std::vector<Row> LevelState::Partitions(int bucket) const {
    std::vector<Row> result;
    for (const auto& [partition, levels] : Bucket(bucket)) {
        result.push_back(partition);
    }
    return result;
}

size_t LevelState::NumLiveFiles() const {
    size_t total = 0;
    for (const auto& partitions : buckets_) {
        for (const auto& [partition, levels] : partitions) {
            for (const auto& level : levels) {
                total += level.size();
            }
        }
    }
    return total;
}

size_t LevelState::MaxLevelSize() const {
    size_t max_size = 0;
    for (const auto& partitions : buckets_) {
        for (const auto& [partition, levels] : partitions) {
            for (const auto& level : levels) {
                max_size = std::max(max_size, level.size());
            }
        }
    }
    return max_size;
}

const std::map<Row, std::vector<Level>>& LevelState::Bucket(int bucket) const {
    if (bucket < 0 || bucket >= NumBuckets()) {
        throw std::out_of_range("Bucket " + std::to_string(bucket) + " outside [0, " +
                                std::to_string(NumBuckets()) + ")");
    }
    return buckets_[static_cast<size_t>(bucket)];
}

std::map<Row, std::vector<Level>>& LevelState::Bucket(int bucket) {
    if (bucket < 0 || bucket >= NumBuckets()) {
        throw std::out_of_range("Bucket " + std::to_string(bucket) + " outside [0, " +
                                std::to_string(NumBuckets()) + ")");
    }
    return buckets_[static_cast<size_t>(bucket)];
}

} // namespace mgen
