#pragma once
#include <cstdint>
#include <string>

namespace kstatpp::stats {

// Instance wildcard for Token::lookup()
constexpr int ANY_INSTANCE = -1;

// ks_type of a kstat. Only NAMED kstats can have their data decoded.
enum class KStatType : uint8_t {
    RAW = 0,
    NAMED = 1,
    INTR = 2,
    IO = 3,
    TIMER = 4
};

// data_type of a named statistic. sys/kstat.h also defines FLOAT (5) and
// DOUBLE (6) but marks them obsolete; they decode as unknown.
enum class NamedType : uint8_t {
    CHAR = 0,
    INT32 = 1,
    UINT32 = 2,
    INT64 = 3,
    UINT64 = 4,
    STRING = 9
};

std::string kstat_type_to_string(KStatType type);
std::string named_type_to_string(NamedType type);

enum class ErrorCode {
    OK,
    OPEN_FAILURE,       // kstat_open() rejected
    CLOSED_TOKEN,       // token closed or gone
    LOOKUP_FAILURE,     // no such kstat or named statistic
    READ_FAILURE,       // kstat_read() failed
    TYPE_MISMATCH,      // named operation on a non-named kstat
    UNKNOWN_DATA_TYPE,  // decoder met a data_type it does not know
    CLOSE_FAILURE       // kstat_close() reported an error
};

const char* error_code_to_string(ErrorCode code);

struct Status {
    ErrorCode code = ErrorCode::OK;
    int sys_errno = 0;
    std::string message;

    bool ok() const { return code == ErrorCode::OK; }

    // "LOOKUP_FAILURE: no kstat cpu:0:sys (No such file or directory)"
    std::string to_string() const;

    static Status failure(ErrorCode code, std::string message, int sys_errno = 0);
};

} // namespace kstatpp::stats
