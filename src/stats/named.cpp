#include "stats/named.hpp"
#include "stats/kstat.hpp"
#include <cstring>
#include <utility>
#include <spdlog/spdlog.h>

namespace kstatpp::stats {

std::optional<NamedValue> decode_named_value(const native::NamedRecord& raw) {
    switch (static_cast<NamedType>(raw.data_type)) {
        case NamedType::STRING: {
            // sys/kstat.h guarantees the terminator; str.len (when set)
            // bounds the buffer.
            const char* ptr = raw.value.str.addr.ptr;
            if (ptr == nullptr) {
                return NamedValue(std::in_place_type<std::string>);
            }
            size_t len = raw.value.str.len > 0 ? strnlen(ptr, raw.value.str.len)
                                                : std::strlen(ptr);
            return NamedValue(std::in_place_type<std::string>, ptr, len);
        }
        case NamedType::CHAR:
            // Short strings stored inline in value.c, not necessarily terminated.
            return NamedValue(std::in_place_type<std::string>, raw.value.c,
                              strnlen(raw.value.c, native::CHAR_DATA_LEN));
        case NamedType::INT32:
            return NamedValue(std::in_place_type<int64_t>, raw.value.i32);
        case NamedType::INT64:
            return NamedValue(std::in_place_type<int64_t>, raw.value.i64);
        case NamedType::UINT32:
            return NamedValue(std::in_place_type<uint64_t>, raw.value.ui32);
        case NamedType::UINT64:
            return NamedValue(std::in_place_type<uint64_t>, raw.value.ui64);
        default:
            return std::nullopt;
    }
}

NamedResult decode_named(const native::NamedRecord& raw, std::shared_ptr<KStat> kstat) {
    NamedResult result;

    Named named;
    named.name = std::string(raw.name, strnlen(raw.name, native::NAME_LEN));
    named.type = static_cast<NamedType>(raw.data_type);
    named.kstat = std::move(kstat);

    auto value = decode_named_value(raw);
    if (!value) {
        // Record layout does not match what we were built against.
        spdlog::critical("Statistic {} has unknown data type {}",
                         named.to_string(), static_cast<int>(raw.data_type));
        result.status = Status::failure(ErrorCode::UNKNOWN_DATA_TYPE,
            "statistic " + named.to_string() + " has " + named_type_to_string(named.type));
        return result;
    }

    if (auto* s = std::get_if<std::string>(&*value)) {
        named.string_val = std::move(*s);
    } else if (auto* i = std::get_if<int64_t>(&*value)) {
        named.int_val = *i;
    } else if (auto* u = std::get_if<uint64_t>(&*value)) {
        named.uint_val = *u;
    }

    result.named = std::move(named);
    return result;
}

std::string Named::to_string() const {
    if (!kstat) {
        return name;
    }
    return kstat->module() + ":" + std::to_string(kstat->instance()) + ":" +
           kstat->name() + ":" + name;
}

nlohmann::json Named::to_json() const {
    nlohmann::json j{
        {"statistic", name},
        {"type", named_type_to_string(type)}
    };

    switch (type) {
        case NamedType::CHAR:
        case NamedType::STRING:
            j["value"] = string_val;
            break;
        case NamedType::INT32:
        case NamedType::INT64:
            j["value"] = int_val;
            break;
        default:
            j["value"] = uint_val;
            break;
    }

    if (kstat) {
        j["module"] = kstat->module();
        j["instance"] = kstat->instance();
        j["name"] = kstat->name();
        j["snaptime"] = kstat->snaptime();
    }
    return j;
}

} // namespace kstatpp::stats
