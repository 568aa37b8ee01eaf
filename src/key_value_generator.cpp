#include "../include/key_value_generator.hpp"

#include <array>
#include <string>

namespace mgen {

namespace {

const std::array<const char*, 3> kDays = {"20211110", "20211111", "20211112"};
constexpr int32_t kMinHour = 8;
constexpr int32_t kMaxHour = 10;
constexpr int32_t kNumShops = 10;

}  // namespace

const RowType& KeyValueGenerator::PartitionType() {
    static const RowType type{
        {"dt", FieldType::kString},
        {"hr", FieldType::kInt},
    };
    return type;
}

const RowType& KeyValueGenerator::KeyType() {
    static const RowType type{
        {"shop_id", FieldType::kInt},
        {"order_id", FieldType::kBigInt},
    };
    return type;
}

const RowType& KeyValueGenerator::ValueType() {
    static const RowType type{
        {"dt", FieldType::kString},
        {"hr", FieldType::kInt},
        {"item_id", FieldType::kBigInt},
        {"price", FieldType::kBigInt},
        {"comment", FieldType::kString},
    };
    return type;
}

KeyValueGenerator::KeyValueGenerator(uint64_t seed) : rng_(seed) {}

KeyValue KeyValueGenerator::Next() {
    Row partition;
    Row key;

    // Roughly one record in three updates or deletes an existing key.
    std::uniform_int_distribution<int> percent(0, 99);
    bool reuse = !used_keys_.empty() && percent(rng_) < 33;
    if (reuse) {
        std::uniform_int_distribution<size_t> pick(0, used_keys_.size() - 1);
        const auto& used = used_keys_[pick(rng_)];
        partition = used.first;
        key = used.second;
    } else {
        partition = RandomPartition();
        std::uniform_int_distribution<int32_t> shop(0, kNumShops - 1);
        std::uniform_int_distribution<int64_t> order(0, 1'000'000'000LL);
        int32_t shop_id = shop(rng_);
        int64_t order_id = order(rng_);
        key = Row{shop_id, order_id};

        if (used_keys_.size() < kMaxRememberedKeys) {
            used_keys_.emplace_back(partition, key);
        } else {
            std::uniform_int_distribution<size_t> slot(0, kMaxRememberedKeys - 1);
            used_keys_[slot(rng_)] = {partition, key};
        }
    }

    KeyValue kv;
    kv.key = std::move(key);
    kv.sequence_number = next_sequence_number_++;
    kv.value_kind = (reuse && percent(rng_) < 60) ? ValueKind::kDelete : ValueKind::kAdd;
    kv.value = RandomValue(partition);
    return kv;
}

Row KeyValueGenerator::GetPartition(const KeyValue& kv) {
    return Row{kv.value.Field(0), kv.value.Field(1)};
}

Row KeyValueGenerator::RandomPartition() {
    std::uniform_int_distribution<size_t> day(0, kDays.size() - 1);
    std::uniform_int_distribution<int32_t> hour(kMinHour, kMaxHour);
    std::string dt = kDays[day(rng_)];
    int32_t hr = hour(rng_);
    return Row{std::move(dt), hr};
}

Row KeyValueGenerator::RandomValue(const Row& partition) {
    std::uniform_int_distribution<int64_t> item(0, 999'999);
    std::uniform_int_distribution<int64_t> price(1, 10'000);
    std::uniform_int_distribution<int> percent(0, 99);

    int64_t item_id = item(rng_);
    int64_t item_price = price(rng_);
    FieldValue comment;
    if (percent(rng_) >= 25) {
        comment = "comment-" + std::to_string(item_id);
    }
    return Row{partition.Field(0), partition.Field(1), item_id, item_price, std::move(comment)};
}

} // namespace mgen
