#include "../include/data_file_supplier.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "../include/logger.hpp"
#include "../include/random_data_file_supplier.hpp"

namespace mgen {

namespace {

[[noreturn]] void ContractViolation(const std::string& message) {
    MGEN_LOG_ERROR("data file supplier contract violation: %s", message.c_str());
    throw std::logic_error(message);
}

}  // namespace

// static
std::unique_ptr<DataFileSupplier> DataFileSupplier::Create(const GeneratorOptions& options) {
    return std::make_unique<RandomDataFileSupplier>(options);
}

void CheckNewFile(const DataFile& file, int num_buckets) {
    if (!file.meta) {
        ContractViolation("new file has no metadata");
    }
    if (file.Level() != 0) {
        ContractViolation("new file " + file.FileName() + " is at level " +
                          std::to_string(file.Level()) + ", expected level 0");
    }
    if (file.bucket < 0 || file.bucket >= num_buckets) {
        ContractViolation("new file " + file.FileName() + " has bucket " + std::to_string(file.bucket) +
                          " outside [0, " + std::to_string(num_buckets) + ")");
    }
}

void CheckMergedFile(const DataFile& file, size_t level, const Row& partition, int bucket) {
    if (!file.meta) {
        ContractViolation("merged file has no metadata");
    }
    if (file.Level() != level) {
        ContractViolation("merged file " + file.FileName() + " is at level " +
                          std::to_string(file.Level()) + ", expected " + std::to_string(level));
    }
    if (file.partition != partition || file.bucket != bucket) {
        ContractViolation("merged file " + file.FileName() + " belongs to partition " +
                          file.partition.ToString() + " bucket " + std::to_string(file.bucket) +
                          ", expected partition " + partition.ToString() + " bucket " +
                          std::to_string(bucket));
    }
}

} // namespace mgen
