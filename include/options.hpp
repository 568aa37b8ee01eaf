#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mgen {

/**
 * @brief Options for configuring the manifest entry generator
 *
 * Fixed at construction time; the generator never changes them afterwards.
 */
class GeneratorOptions {
public:
    // Number of buckets per partition. Bucket ids are in [0, num_buckets).
    int num_buckets{3};

    // Records accumulated per partition/bucket before a level-0 file is produced.
    // Merged files at level L hold up to mem_table_capacity^(L+1) records.
    std::size_t mem_table_capacity{3};

    // Seed of the default data file supplier. Unset means a random seed.
    std::optional<uint64_t> seed;

    // Synthetic manifest size per entry, see ManifestFileMeta::Summarize
    uint64_t manifest_size_per_entry{100};

    // "debug", "info", "warning" or "error"
    std::string log_level{"warning"};
    bool log_to_stdout{false};

    GeneratorOptions() = default;

    /**
     * @brief Check value ranges.
     *
     * @throws std::invalid_argument naming the first offending field
     */
    void Validate() const;

    /**
     * @brief Parse options from a JSON object. Missing keys keep their defaults.
     *
     * @throws std::invalid_argument if `j` is not an object or a value has the wrong type
     */
    static GeneratorOptions FromJson(const nlohmann::json& j);

    /**
     * @brief Read and parse a JSON options file.
     *
     * @throws std::invalid_argument if the file cannot be read or parsed
     */
    static GeneratorOptions FromFile(const std::filesystem::path& path);

    nlohmann::json ToJson() const;

    // Apply log_level / log_to_stdout to the process-wide logger.
    void ConfigureLogging() const;
};

} // namespace mgen
