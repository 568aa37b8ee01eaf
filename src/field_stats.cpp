#include "../include/field_stats.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace mgen {

nlohmann::json FieldStats::ToJson() const {
    return {
        {"min", FieldValueToJson(min_value)},
        {"max", FieldValueToJson(max_value)},
        {"null_count", null_count}
    };
}

FieldStatsCollector::FieldStatsCollector(RowType row_type)
    : row_type_(std::move(row_type)), stats_(row_type_.Arity()) {}

void FieldStatsCollector::Collect(const Row& row) {
    if (row.Arity() != row_type_.Arity()) {
        throw std::invalid_argument("Row " + row.ToString() + " has " + std::to_string(row.Arity()) +
                                    " fields, schema expects " + std::to_string(row_type_.Arity()));
    }

    for (size_t i = 0; i < row.Arity(); ++i) {
        const FieldValue& value = row.Field(i);
        FieldStats& stats = stats_[i];
        if (IsNull(value)) {
            stats.null_count++;
            continue;
        }
        if (!MatchesType(value, row_type_.fields[i].type)) {
            throw std::invalid_argument("Field '" + row_type_.fields[i].name + "' of row " +
                                        row.ToString() + " does not match its declared type");
        }
        // Same alternative on both sides, so variant ordering is value ordering.
        if (IsNull(stats.min_value) || value < stats.min_value) {
            stats.min_value = value;
        }
        if (IsNull(stats.max_value) || stats.max_value < value) {
            stats.max_value = value;
        }
    }
}

} // namespace mgen
