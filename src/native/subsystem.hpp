/**
 * kstatpp native seam
 *
 * Abstract view of the kernel statistics facility (libkstat on illumos /
 * Solaris). Everything above this layer talks to kstats only through
 * Subsystem and Handle, never through kstat.h directly.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace kstatpp::native {

constexpr size_t NAME_LEN = 31;         // KSTAT_STRLEN
constexpr size_t CHAR_DATA_LEN = 16;    // sizeof(kstat_named_t::value.c)

class Handle;

// Opaque identity of one kstat on the chain. Stable for the lifetime of the
// handle that produced it; only meaningful to compare and hash. Only Handle
// implementations can mint one.
class RecordId {
public:
    RecordId() = default;

    bool operator==(const RecordId& other) const { return value_ == other.value_; }
    bool operator!=(const RecordId& other) const { return value_ != other.value_; }

private:
    friend class Handle;
    friend struct RecordIdHash;

    explicit RecordId(std::uintptr_t value) : value_(value) {}

    std::uintptr_t value_ = 0;
};

struct RecordIdHash {
    size_t operator()(const RecordId& id) const {
        return std::hash<std::uintptr_t>()(id.value_);
    }
};

// Copy of the kstat_t header fields
struct RecordHeader {
    std::string module;
    int instance = 0;
    std::string name;
    std::string ks_class;
    uint8_t type = 0;
    int64_t crtime = 0;         // hrtime_t, ns since an arbitrary point
    int64_t snaptime = 0;
    uint32_t ndata = 0;
    bool has_data = false;      // ks_data populated by a previous read
};

// Mirrors kstat_named_t. For string data, value.str.addr.ptr points into
// native memory that stays valid until the next read of the same kstat.
struct NamedRecord {
    char name[NAME_LEN];
    uint8_t data_type;
    union {
        char c[CHAR_DATA_LEN];
        int32_t i32;
        uint32_t ui32;
        int64_t i64;
        uint64_t ui64;
        struct {
            union {
                char* ptr;
                char pad[8];
            } addr;
            uint32_t len;       // buffer length including the terminator
        } str;
    } value;
};

// An open kstat_ctl_t. Integer returns are 0 or an errno value.
class Handle {
public:
    virtual ~Handle() = default;

    virtual int close() = 0;

    // kc_chain / ks_next traversal
    virtual std::optional<RecordId> chain_head() const = 0;
    virtual std::optional<RecordId> chain_next(RecordId id) const = 0;

    // kstat_lookup(); empty module/name and instance -1 are wildcards
    virtual int lookup(const std::string& module, int instance,
                       const std::string& name, RecordId& out) = 0;

    virtual RecordHeader header(RecordId id) const = 0;

    // kstat_read(); refreshes data and snaptime
    virtual int read(RecordId id) = 0;

    // kstat_data_lookup()
    virtual std::optional<NamedRecord> named_lookup(RecordId id, const std::string& name) const = 0;

    // n-th entry of a loaded named kstat, nullopt past ks_ndata
    virtual std::optional<NamedRecord> named_at(RecordId id, uint32_t index) const = 0;

protected:
    // Conversions between a binding's own key and the opaque id
    static RecordId make_id(std::uintptr_t key) { return RecordId(key); }
    static std::uintptr_t id_key(RecordId id) { return id.value_; }
};

class Subsystem {
public:
    virtual ~Subsystem() = default;

    // kstat_open()
    virtual int open(std::unique_ptr<Handle>& out) = 0;
};

// The platform's kstat facility.
std::shared_ptr<Subsystem> system_subsystem();

} // namespace kstatpp::native
