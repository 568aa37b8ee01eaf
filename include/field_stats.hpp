#pragma once

#include <cstdint>
#include <vector>

#include <nlohmann/json.hpp>

#include "row.hpp"

namespace mgen {

// Statistics of one field. min/max stay null when no non-null value was seen.
struct FieldStats {
    FieldValue min_value;
    FieldValue max_value;
    int64_t null_count{0};

    nlohmann::json ToJson() const;

    bool operator==(const FieldStats& other) const {
        return min_value == other.min_value && max_value == other.max_value &&
               null_count == other.null_count;
    }
};

/**
 * @brief Accumulates per-field min / max / null count over a stream of rows.
 */
class FieldStatsCollector {
public:
    explicit FieldStatsCollector(RowType row_type);

    /**
     * @brief Fold one row into the statistics.
     *
     * @throws std::invalid_argument if the row does not match the schema
     */
    void Collect(const Row& row);

    std::vector<FieldStats> Extract() const { return stats_; }

private:
    RowType row_type_;
    std::vector<FieldStats> stats_;
};

} // namespace mgen
