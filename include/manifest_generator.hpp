#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "data_file_supplier.hpp"
#include "level_merger.hpp"
#include "level_state.hpp"
#include "manifest_entry.hpp"
#include "manifest_file_meta.hpp"
#include "options.hpp"
#include "row.hpp"

namespace mgen {

/**
 * @brief Produces a stream of manifest entries consistent with leveled compaction.
 *
 * Every generation step takes one new level-0 file from the supplier, emits
 * an ADD for it and merges overflowing levels of its (bucket, partition),
 * emitting DELETE/ADD entries for the merge. Entries of a step are buffered
 * and handed out newest first: a step that emits
 * [ADD(file), DELETE(a), DELETE(b), ADD(merged)] is returned by Next() as
 * ADD(merged), DELETE(b), DELETE(a), ADD(file).
 *
 * Not thread-safe.
 */
class ManifestTestDataGenerator {
public:
    // Uses the default RandomDataFileSupplier.
    explicit ManifestTestDataGenerator(const GeneratorOptions& options = {});

    ManifestTestDataGenerator(const GeneratorOptions& options,
                              std::unique_ptr<DataFileSupplier> supplier);

    ManifestTestDataGenerator(const ManifestTestDataGenerator&) = delete;
    ManifestTestDataGenerator& operator=(const ManifestTestDataGenerator&) = delete;

    /**
     * @brief Next entry of the stream.
     *
     * @throws std::logic_error if the supplier breaks its contract
     */
    ManifestEntry Next();

    /**
     * @brief Summary metadata of a non-empty batch of entries.
     *
     * Partition statistics use the default supplier's partition schema.
     *
     * @throws std::invalid_argument if `entries` is empty
     */
    ManifestFileMeta CreateManifestFileMeta(const std::vector<ManifestEntry>& entries) const;

    // Same as above with an explicit partition schema, for custom suppliers.
    ManifestFileMeta CreateManifestFileMeta(const std::vector<ManifestEntry>& entries,
                                            const RowType& partition_type) const;

    // Entries of the current step not yet returned by Next().
    size_t PendingEntries() const noexcept { return buffered_results_.size(); }

    const LevelState& State() const noexcept { return levels_; }

    int NumBuckets() const noexcept { return num_buckets_; }

    // Generation steps run so far, and merges done by them.
    uint64_t NumSteps() const noexcept { return num_steps_; }
    uint64_t NumMerges() const noexcept { return num_merges_; }

private:
    void GenerateStep();

    int num_buckets_;
    uint64_t manifest_size_per_entry_;
    std::unique_ptr<DataFileSupplier> supplier_;
    LevelState levels_;
    LevelMerger merger_;
    ManifestEntryStack buffered_results_;

    uint64_t num_steps_ = 0;
    uint64_t num_merges_ = 0;
};

} // namespace mgen
