#include "../include/key_value.hpp"

namespace mgen {

const char* ValueKindName(ValueKind kind) {
    switch (kind) {
        case ValueKind::kAdd: return "ADD";
        case ValueKind::kDelete: return "DELETE";
    }
    return "UNKNOWN";
}

void KeyValue::EncodeTo(std::vector<uint8_t>& buf) const {
    key.EncodeTo(buf);
    for (int shift = 0; shift < 64; shift += 8) {
        buf.push_back(static_cast<uint8_t>((sequence_number >> shift) & 0xFF));
    }
    buf.push_back(static_cast<uint8_t>(value_kind));
    value.EncodeTo(buf);
}

} // namespace mgen
