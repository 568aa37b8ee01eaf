#include "../include/data_file.hpp"

namespace mgen {

nlohmann::json DataFileMeta::ToJson() const {
    nlohmann::json stats = nlohmann::json::array();
    for (const auto& s : key_stats) {
        stats.push_back(s.ToJson());
    }
    return {
        {"file_name", file_name},
        {"file_size", file_size},
        {"row_count", row_count},
        {"min_key", min_key.ToJson()},
        {"max_key", max_key.ToJson()},
        {"key_stats", stats},
        {"min_sequence_number", min_sequence_number},
        {"max_sequence_number", max_sequence_number},
        {"level", level},
        {"checksum", checksum}
    };
}

} // namespace mgen
