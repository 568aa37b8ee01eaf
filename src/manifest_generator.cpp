#include "../include/manifest_generator.hpp"

#include <stdexcept>
#include <utility>

#include "../include/key_value_generator.hpp"
#include "../include/logger.hpp"

namespace mgen {

namespace {

const GeneratorOptions& Validated(const GeneratorOptions& options) {
    options.Validate();
    return options;
}

std::unique_ptr<DataFileSupplier> Required(std::unique_ptr<DataFileSupplier> supplier) {
    if (!supplier) {
        throw std::invalid_argument("ManifestTestDataGenerator requires a data file supplier");
    }
    return supplier;
}

}  // namespace

ManifestTestDataGenerator::ManifestTestDataGenerator(const GeneratorOptions& options)
    : ManifestTestDataGenerator(options, DataFileSupplier::Create(Validated(options))) {}

ManifestTestDataGenerator::ManifestTestDataGenerator(const GeneratorOptions& options,
                                                     std::unique_ptr<DataFileSupplier> supplier)
    : num_buckets_(Validated(options).num_buckets),
      manifest_size_per_entry_(options.manifest_size_per_entry),
      supplier_(Required(std::move(supplier))),
      levels_(options.num_buckets),
      merger_(*supplier_, options.num_buckets) {}

ManifestEntry ManifestTestDataGenerator::Next() {
    if (buffered_results_.empty()) {
        GenerateStep();
    }
    ManifestEntry entry = std::move(buffered_results_.top());
    buffered_results_.pop();
    return entry;
}

void ManifestTestDataGenerator::GenerateStep() {
    DataFile file = supplier_->NextFile();
    CheckNewFile(file, num_buckets_);

    Row partition = file.partition;
    int bucket = file.bucket;
    DataFileMetaPtr meta = file.meta;
    MGEN_LOG_DEBUG("step %lu: new file %s (%lu records) in partition %s bucket %d",
                   static_cast<unsigned long>(num_steps_), meta->file_name.c_str(),
                   static_cast<unsigned long>(meta->row_count), partition.ToString().c_str(), bucket);

    levels_.RecordNewFile(std::move(file));
    buffered_results_.emplace(ValueKind::kAdd, partition, bucket, num_buckets_, std::move(meta));

    num_merges_ += merger_.MergeLevelsIfNeeded(levels_, partition, bucket, buffered_results_);
    ++num_steps_;
}

ManifestFileMeta ManifestTestDataGenerator::CreateManifestFileMeta(
    const std::vector<ManifestEntry>& entries) const {
    return CreateManifestFileMeta(entries, KeyValueGenerator::PartitionType());
}

ManifestFileMeta ManifestTestDataGenerator::CreateManifestFileMeta(
    const std::vector<ManifestEntry>& entries, const RowType& partition_type) const {
    return ManifestFileMeta::Summarize(entries, partition_type, manifest_size_per_entry_);
}

} // namespace mgen
