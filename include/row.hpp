#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace mgen {

enum class FieldType {
    kInt,     // 32-bit
    kBigInt,  // 64-bit
    kString,
};

// std::monostate is SQL NULL.
using FieldValue = std::variant<std::monostate, int32_t, int64_t, std::string>;

bool IsNull(const FieldValue& value);
bool MatchesType(const FieldValue& value, FieldType type);
std::string FieldValueToString(const FieldValue& value);
nlohmann::json FieldValueToJson(const FieldValue& value);

/**
 * @brief Named, typed list of fields describing a Row.
 */
struct RowType {
    struct Field {
        std::string name;
        FieldType type;
    };

    std::vector<Field> fields;

    RowType() = default;
    RowType(std::initializer_list<Field> f) : fields(f) {}

    size_t Arity() const { return fields.size(); }
};

/**
 * @brief Immutable tuple of nullable field values.
 *
 * Used for partition keys, record keys and record values. Rows are totally
 * ordered (field by field, null first) so they can key ordered maps.
 */
class Row {
public:
    Row() = default;
    explicit Row(std::vector<FieldValue> fields) : fields_(std::move(fields)) {}
    Row(std::initializer_list<FieldValue> fields) : fields_(fields) {}

    size_t Arity() const noexcept { return fields_.size(); }
    const FieldValue& Field(size_t pos) const { return fields_.at(pos); }
    bool IsNullAt(size_t pos) const { return IsNull(fields_.at(pos)); }
    const std::vector<FieldValue>& Fields() const noexcept { return fields_; }

    // Appends a stable, platform independent encoding of this row to `buf`.
    void EncodeTo(std::vector<uint8_t>& buf) const;

    // crc32 over EncodeTo(); identical for equal rows across runs and builds.
    uint32_t HashCode() const;

    std::string ToString() const;
    nlohmann::json ToJson() const;

    bool operator==(const Row& other) const { return fields_ == other.fields_; }
    bool operator!=(const Row& other) const { return !(*this == other); }
    bool operator<(const Row& other) const { return fields_ < other.fields_; }

private:
    std::vector<FieldValue> fields_;
};

} // namespace mgen
