#pragma once

#include <map>
#include <vector>

#include "data_file.hpp"
#include "row.hpp"

namespace mgen {

// Live files of one level, in installation order.
using Level = std::vector<DataFile>;

/**
 * @brief Live data files per bucket, per partition, per level.
 *
 * Buckets are allocated up front. A partition shows up in a bucket with its
 * first file; from then on level 0 always exists. Only structure is kept
 * here, merging is done by LevelMerger.
 */
class LevelState {
public:
    explicit LevelState(int num_buckets);

    /**
     * @brief Insert `file` at level `file.Level()` of its (bucket, partition).
     *
     * Creates the partition and any missing levels up to the file's level.
     *
     * @throws std::out_of_range if the bucket is outside [0, num_buckets)
     */
    void RecordNewFile(DataFile file);

    /**
     * @brief Levels of a known (bucket, partition) pair.
     *
     * @throws std::out_of_range if no file of this pair was recorded yet
     */
    std::vector<Level>& LevelsFor(int bucket, const Row& partition);
    const std::vector<Level>& LevelsFor(int bucket, const Row& partition) const;

    // Adds empty levels until `levels[level]` exists.
    static void EnsureLevel(std::vector<Level>& levels, size_t level);

    bool Contains(int bucket, const Row& partition) const;

    // Partitions known in `bucket`, in ascending order.
    std::vector<Row> Partitions(int bucket) const;

    int NumBuckets() const noexcept { return static_cast<int>(buckets_.size()); }

    // Total live files over all buckets, partitions and levels.
    size_t NumLiveFiles() const;

    // Largest file count of any level.
    size_t MaxLevelSize() const;

private:
    const std::map<Row, std::vector<Level>>& Bucket(int bucket) const;
    std::map<Row, std::vector<Level>>& Bucket(int bucket);

    std::vector<std::map<Row, std::vector<Level>>> buckets_;
};

} // namespace mgen
