/**
 * kstatpp native seam - libkstat binding
 *
 * Built only where kstat.h and libkstat are available (illumos, Solaris).
 */

#include "native/subsystem.hpp"
#include <cerrno>
#include <cstring>
#include <kstat.h>
#include <spdlog/spdlog.h>

namespace kstatpp::native {

namespace {

std::string bounded_string(const char* s, size_t max) {
    return std::string(s, strnlen(s, max));
}

NamedRecord copy_named(const kstat_named_t* knp) {
    NamedRecord rec;
    std::memset(&rec, 0, sizeof(rec));
    std::memcpy(rec.name, knp->name, NAME_LEN);
    rec.data_type = knp->data_type;
    if (knp->data_type == KSTAT_DATA_STRING) {
        rec.value.str.addr.ptr = KSTAT_NAMED_STR_PTR(knp);
        rec.value.str.len = KSTAT_NAMED_STR_BUFLEN(knp);
    } else {
        std::memcpy(rec.value.c, knp->value.c, CHAR_DATA_LEN);
    }
    return rec;
}

class LibkstatHandle : public Handle {
public:
    explicit LibkstatHandle(kstat_ctl_t* kc) : kc_(kc) {}

    ~LibkstatHandle() override {
        if (kc_ != nullptr && kstat_close(kc_) != 0) {
            spdlog::warn("kstat_close on handle destruction failed: {}", std::strerror(errno));
        }
    }

    LibkstatHandle(const LibkstatHandle&) = delete;
    LibkstatHandle& operator=(const LibkstatHandle&) = delete;

    int close() override {
        if (kc_ == nullptr) return 0;
        int res = kstat_close(kc_);
        int err = errno;
        kc_ = nullptr;
        return res != 0 ? err : 0;
    }

    std::optional<RecordId> chain_head() const override {
        if (kc_ == nullptr || kc_->kc_chain == nullptr) return std::nullopt;
        return to_id(kc_->kc_chain);
    }

    std::optional<RecordId> chain_next(RecordId id) const override {
        kstat_t* next = to_ksp(id)->ks_next;
        if (next == nullptr) return std::nullopt;
        return to_id(next);
    }

    int lookup(const std::string& module, int instance,
               const std::string& name, RecordId& out) override {
        // kstat_lookup() takes non-const char*, so hand it owned copies.
        std::string ms = module;
        std::string ns = name;
        errno = 0;
        kstat_t* ksp = kstat_lookup(kc_,
                                    module.empty() ? nullptr : &ms[0],
                                    instance,
                                    name.empty() ? nullptr : &ns[0]);
        if (ksp == nullptr) {
            return errno != 0 ? errno : ENOENT;
        }
        out = to_id(ksp);
        return 0;
    }

    RecordHeader header(RecordId id) const override {
        const kstat_t* ksp = to_ksp(id);
        RecordHeader h;
        h.module = bounded_string(ksp->ks_module, KSTAT_STRLEN);
        h.instance = ksp->ks_instance;
        h.name = bounded_string(ksp->ks_name, KSTAT_STRLEN);
        h.ks_class = bounded_string(ksp->ks_class, KSTAT_STRLEN);
        h.type = ksp->ks_type;
        h.crtime = static_cast<int64_t>(ksp->ks_crtime);
        h.snaptime = static_cast<int64_t>(ksp->ks_snaptime);
        h.ndata = ksp->ks_ndata;
        h.has_data = ksp->ks_data != nullptr;
        return h;
    }

    int read(RecordId id) override {
        if (kstat_read(kc_, to_ksp(id), nullptr) == -1) {
            return errno;
        }
        return 0;
    }

    std::optional<NamedRecord> named_lookup(RecordId id, const std::string& name) const override {
        std::string ns = name;
        auto* knp = static_cast<kstat_named_t*>(kstat_data_lookup(to_ksp(id), &ns[0]));
        if (knp == nullptr) return std::nullopt;
        return copy_named(knp);
    }

    std::optional<NamedRecord> named_at(RecordId id, uint32_t index) const override {
        kstat_t* ksp = to_ksp(id);
        if (ksp->ks_data == nullptr || ksp->ks_type != KSTAT_TYPE_NAMED || index >= ksp->ks_ndata) {
            return std::nullopt;
        }
        return copy_named(KSTAT_NAMED_PTR(ksp) + index);
    }

private:
    static kstat_t* to_ksp(RecordId id) {
        return reinterpret_cast<kstat_t*>(id_key(id));
    }

    static RecordId to_id(kstat_t* ksp) {
        return make_id(reinterpret_cast<std::uintptr_t>(ksp));
    }

    kstat_ctl_t* kc_;
};

class LibkstatSubsystem : public Subsystem {
public:
    int open(std::unique_ptr<Handle>& out) override {
        kstat_ctl_t* kc = kstat_open();
        if (kc == nullptr) {
            int err = errno;
            spdlog::warn("kstat_open failed: {}", std::strerror(err));
            return err;
        }
        out = std::make_unique<LibkstatHandle>(kc);
        return 0;
    }
};

} // namespace

std::shared_ptr<Subsystem> system_subsystem() {
    return std::make_shared<LibkstatSubsystem>();
}

} // namespace kstatpp::native
