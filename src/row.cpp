#include "../include/row.hpp"

#include <zlib.h>

#include <sstream>
#include <type_traits>

namespace mgen {

namespace {

// Field tags of the row encoding.
constexpr uint8_t kTagNull = 0;
constexpr uint8_t kTagInt = 1;
constexpr uint8_t kTagBigInt = 2;
constexpr uint8_t kTagString = 3;

inline void PutU32LE(std::vector<uint8_t>& buf, uint32_t v) {
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

inline void PutU64LE(std::vector<uint8_t>& buf, uint64_t v) {
    PutU32LE(buf, static_cast<uint32_t>(v & 0xFFFFFFFFu));
    PutU32LE(buf, static_cast<uint32_t>(v >> 32));
}

}  // namespace

bool IsNull(const FieldValue& value) {
    return std::holds_alternative<std::monostate>(value);
}

bool MatchesType(const FieldValue& value, FieldType type) {
    switch (type) {
        case FieldType::kInt: return std::holds_alternative<int32_t>(value);
        case FieldType::kBigInt: return std::holds_alternative<int64_t>(value);
        case FieldType::kString: return std::holds_alternative<std::string>(value);
    }
    return false;
}

std::string FieldValueToString(const FieldValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "null";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            return std::to_string(v);
        }
    }, value);
}

nlohmann::json FieldValueToJson(const FieldValue& value) {
    return std::visit([](const auto& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else {
            return v;
        }
    }, value);
}

void Row::EncodeTo(std::vector<uint8_t>& buf) const {
    PutU32LE(buf, static_cast<uint32_t>(fields_.size()));
    for (const auto& field : fields_) {
        if (const auto* i = std::get_if<int32_t>(&field)) {
            buf.push_back(kTagInt);
            PutU32LE(buf, static_cast<uint32_t>(*i));
        } else if (const auto* l = std::get_if<int64_t>(&field)) {
            buf.push_back(kTagBigInt);
            PutU64LE(buf, static_cast<uint64_t>(*l));
        } else if (const auto* s = std::get_if<std::string>(&field)) {
            buf.push_back(kTagString);
            PutU32LE(buf, static_cast<uint32_t>(s->size()));
            buf.insert(buf.end(), s->begin(), s->end());
        } else {
            buf.push_back(kTagNull);
        }
    }
}

uint32_t Row::HashCode() const {
    std::vector<uint8_t> buf;
    EncodeTo(buf);
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, buf.data(), static_cast<uInt>(buf.size()));
    return static_cast<uint32_t>(crc);
}

std::string Row::ToString() const {
    std::ostringstream oss;
    oss << "(";
    for (size_t i = 0; i < fields_.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << FieldValueToString(fields_[i]);
    }
    oss << ")";
    return oss.str();
}

nlohmann::json Row::ToJson() const {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& field : fields_) {
        j.push_back(FieldValueToJson(field));
    }
    return j;
}

} // namespace mgen
