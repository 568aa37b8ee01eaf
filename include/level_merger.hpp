#pragma once

// Merge cascade keeping every level of a (bucket, partition) within capacity.
// Follows the simple leveled compaction scheme: an overflowing level is
// merged together with the level below it into that lower level.

#include <cstddef>

#include "data_file_supplier.hpp"
#include "level_state.hpp"
#include "manifest_entry.hpp"
#include "row.hpp"

namespace mgen {

class LevelMerger {
public:
    // Maximum number of live files per level once a generation step is done.
    static constexpr size_t kLevelCapacity = 3;

    LevelMerger(DataFileSupplier& supplier, int total_buckets);

    LevelMerger(const LevelMerger&) = delete;
    LevelMerger& operator=(const LevelMerger&) = delete;

    /**
     * @brief Merge overflowing levels of (bucket, partition), starting at level 0.
     *
     * While level L holds more than kLevelCapacity files, all files of L and
     * L+1 are deleted and replaced by the supplier's re-packing of their
     * records at L+1. For each merge the entries pushed to `out` are: DELETE
     * for every file of L, DELETE for every file of L+1, ADD for every new
     * file, in level order.
     *
     * @return number of merges performed
     * @throws std::logic_error if the supplier breaks its contract; the
     *         offending merge leaves state and `out` untouched
     */
    size_t MergeLevelsIfNeeded(LevelState& state, const Row& partition, int bucket,
                               ManifestEntryStack& out);

private:
    DataFileSupplier& supplier_;
    int total_buckets_;
};

} // namespace mgen
