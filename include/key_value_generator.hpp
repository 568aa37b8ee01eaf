#pragma once

#include <cstdint>
#include <random>
#include <utility>
#include <vector>

#include "key_value.hpp"
#include "row.hpp"

namespace mgen {

/**
 * @brief Random records over a small order-table schema.
 *
 *   partition: (dt STRING, hr INT)
 *   key:       (shop_id INT, order_id BIGINT)
 *   value:     (dt STRING, hr INT, item_id BIGINT, price BIGINT, comment STRING)
 *
 * The partition of a record is carried in the first two value fields.
 * Sequence numbers strictly increase from 0.
 */
class KeyValueGenerator {
public:
    static const RowType& PartitionType();
    static const RowType& KeyType();
    static const RowType& ValueType();

    explicit KeyValueGenerator(uint64_t seed);

    KeyValue Next();

    static Row GetPartition(const KeyValue& kv);

private:
    static constexpr size_t kMaxRememberedKeys = 1000;

    Row RandomPartition();
    Row RandomValue(const Row& partition);

    std::mt19937_64 rng_;
    uint64_t next_sequence_number_ = 0;

    // (partition, key) pairs already generated, so updates and deletes hit existing keys.
    std::vector<std::pair<Row, Row>> used_keys_;
};

} // namespace mgen
