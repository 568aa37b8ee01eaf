#include "../include/options.hpp"

#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>

#include "../include/logger.hpp"

namespace mgen {

namespace {

// nlohmann converts negative or fractional numbers to unsigned types without
// complaint, so the JSON type is checked before reading.
template <typename T>
T GetUnsigned(const nlohmann::json& j, const char* field) {
    const auto& value = j.at(field);
    if (!value.is_number_unsigned()) {
        throw std::invalid_argument(std::string("Invalid generator options: ") + field +
                                    " must be a non-negative integer, got " + value.dump());
    }
    uint64_t raw = value.get<uint64_t>();
    if (raw > std::numeric_limits<T>::max()) {
        throw std::invalid_argument(std::string("Invalid generator options: ") + field +
                                    " is out of range, got " + value.dump());
    }
    return static_cast<T>(raw);
}

int GetInt(const nlohmann::json& j, const char* field) {
    const auto& value = j.at(field);
    if (!value.is_number_integer()) {
        throw std::invalid_argument(std::string("Invalid generator options: ") + field +
                                    " must be an integer, got " + value.dump());
    }
    bool in_range = value.is_number_unsigned()
                        ? value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
                        : value.get<int64_t>() >= std::numeric_limits<int>::min() &&
                              value.get<int64_t>() <= std::numeric_limits<int>::max();
    if (!in_range) {
        throw std::invalid_argument(std::string("Invalid generator options: ") + field +
                                    " is out of range, got " + value.dump());
    }
    return static_cast<int>(value.get<int64_t>());
}

}  // namespace

void GeneratorOptions::Validate() const {
    if (num_buckets <= 0) {
        throw std::invalid_argument("num_buckets must be positive, got " + std::to_string(num_buckets));
    }
    // A capacity of one never lets merged files grow, so cascades would not terminate.
    if (mem_table_capacity < 2) {
        throw std::invalid_argument("mem_table_capacity must be at least 2, got " +
                                    std::to_string(mem_table_capacity));
    }
    if (manifest_size_per_entry == 0) {
        throw std::invalid_argument("manifest_size_per_entry must be positive");
    }
    // Throws on unknown names.
    (void)logger::ParseLevel(log_level);
}

GeneratorOptions GeneratorOptions::FromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Generator options must be a JSON object");
    }

    GeneratorOptions options;
    try {
        if (j.contains("num_buckets")) {
            options.num_buckets = GetInt(j, "num_buckets");
        }
        if (j.contains("mem_table_capacity")) {
            options.mem_table_capacity = GetUnsigned<std::size_t>(j, "mem_table_capacity");
        }
        if (j.contains("seed") && !j.at("seed").is_null()) {
            options.seed = GetUnsigned<uint64_t>(j, "seed");
        }
        if (j.contains("manifest_size_per_entry")) {
            options.manifest_size_per_entry = GetUnsigned<uint64_t>(j, "manifest_size_per_entry");
        }
        if (j.contains("log_level")) {
            options.log_level = j.at("log_level").get<std::string>();
        }
        if (j.contains("log_to_stdout")) {
            options.log_to_stdout = j.at("log_to_stdout").get<bool>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Invalid generator options: ") + e.what());
    }
    return options;
}

GeneratorOptions GeneratorOptions::FromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::invalid_argument("Failed to open options file: " + path.string());
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument("Malformed options file " + path.string() + ": " + e.what());
    }
    return FromJson(j);
}

nlohmann::json GeneratorOptions::ToJson() const {
    nlohmann::json j = {
        {"num_buckets", num_buckets},
        {"mem_table_capacity", mem_table_capacity},
        {"manifest_size_per_entry", manifest_size_per_entry},
        {"log_level", log_level},
        {"log_to_stdout", log_to_stdout}
    };
    if (seed.has_value()) {
        j["seed"] = *seed;
    } else {
        j["seed"] = nullptr;
    }
    return j;
}

void GeneratorOptions::ConfigureLogging() const {
    logger::LogConfig config;
    config.min_level = logger::ParseLevel(log_level);
    config.use_stdout = log_to_stdout;
    logger::Logger::instance().configure(config);
}

} // namespace mgen
