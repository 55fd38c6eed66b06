#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "native/subsystem.hpp"
#include "stats/types.hpp"

namespace kstatpp::stats {

class KStat;

using NamedValue = std::variant<std::string, int64_t, uint64_t>;

/**
 * One module:instance:name:statistic value as of the parent's last refresh.
 *
 * Only the slot selected by type is meaningful; the others hold their zero
 * values. CHAR and STRING land in string_val, INT32/INT64 in int_val,
 * UINT32/UINT64 in uint_val. Never updated after creation.
 */
struct Named {
    std::string name;
    NamedType type = NamedType::CHAR;

    std::string string_val;
    int64_t int_val = 0;
    uint64_t uint_val = 0;

    // Parent kstat, for the full name and crtime/snaptime
    std::shared_ptr<KStat> kstat;

    // "<module>:<instance>:<name>:<statistic>"
    std::string to_string() const;

    nlohmann::json to_json() const;
};

struct NamedResult {
    Status status;
    std::optional<Named> named;
};

struct NamedListResult {
    Status status;
    std::vector<Named> named;
};

// Decodes the value union of a raw record. nullopt when data_type is not
// one of the six known kinds.
std::optional<NamedValue> decode_named_value(const native::NamedRecord& raw);

// Builds a Named from a raw record; UNKNOWN_DATA_TYPE for unknown kinds.
NamedResult decode_named(const native::NamedRecord& raw, std::shared_ptr<KStat> kstat);

} // namespace kstatpp::stats
