#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "row.hpp"

namespace mgen {

// Kind of a record, and of a manifest entry.
enum class ValueKind : uint8_t {
    kAdd = 0,
    kDelete = 1,
};

const char* ValueKindName(ValueKind kind);

// One logical record stored in a data file.
struct KeyValue {
    Row key;
    uint64_t sequence_number{0};
    ValueKind value_kind{ValueKind::kAdd};
    Row value;

    void EncodeTo(std::vector<uint8_t>& buf) const;

    bool operator==(const KeyValue& other) const {
        return key == other.key && sequence_number == other.sequence_number &&
               value_kind == other.value_kind && value == other.value;
    }
};

// Orders records by key, then by sequence number.
struct KeyValueOrder {
    bool operator()(const KeyValue& a, const KeyValue& b) const {
        if (a.key != b.key) return a.key < b.key;
        return a.sequence_number < b.sequence_number;
    }
};

} // namespace mgen
