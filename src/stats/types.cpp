#include "stats/types.hpp"
#include <cstring>
#include <utility>

namespace kstatpp::stats {

std::string kstat_type_to_string(KStatType type) {
    switch (type) {
        case KStatType::RAW:   return "raw";
        case KStatType::NAMED: return "named";
        case KStatType::INTR:  return "interrupt";
        case KStatType::IO:    return "io";
        case KStatType::TIMER: return "timer";
        default:
            return "kstat_type:" + std::to_string(static_cast<int>(type));
    }
}

std::string named_type_to_string(NamedType type) {
    switch (type) {
        case NamedType::CHAR:   return "char";
        case NamedType::INT32:  return "int32";
        case NamedType::UINT32: return "uint32";
        case NamedType::INT64:  return "int64";
        case NamedType::UINT64: return "uint64";
        case NamedType::STRING: return "string";
        default:
            return "named_type-" + std::to_string(static_cast<int>(type));
    }
}

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:                return "OK";
        case ErrorCode::OPEN_FAILURE:      return "OPEN_FAILURE";
        case ErrorCode::CLOSED_TOKEN:      return "CLOSED_TOKEN";
        case ErrorCode::LOOKUP_FAILURE:    return "LOOKUP_FAILURE";
        case ErrorCode::READ_FAILURE:      return "READ_FAILURE";
        case ErrorCode::TYPE_MISMATCH:     return "TYPE_MISMATCH";
        case ErrorCode::UNKNOWN_DATA_TYPE: return "UNKNOWN_DATA_TYPE";
        case ErrorCode::CLOSE_FAILURE:     return "CLOSE_FAILURE";
        default: return "UNKNOWN";
    }
}

std::string Status::to_string() const {
    std::string out = error_code_to_string(code);
    if (!message.empty()) {
        out += ": " + message;
    }
    if (sys_errno != 0) {
        out += " (" + std::string(std::strerror(sys_errno)) + ")";
    }
    return out;
}

Status Status::failure(ErrorCode code, std::string message, int sys_errno) {
    Status s;
    s.code = code;
    s.sys_errno = sys_errno;
    s.message = std::move(message);
    return s;
}

} // namespace kstatpp::stats
