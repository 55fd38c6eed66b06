#include "stats/kstat.hpp"
#include "stats/session.hpp"
#include <cerrno>
#include <cstring>
#include <mutex>
#include <utility>
#include <vector>
#include <spdlog/spdlog.h>

namespace kstatpp::stats {

namespace {

Status closed_status() {
    return Status::failure(ErrorCode::CLOSED_TOKEN, "invalid kstat or closed token");
}

} // namespace

KStat::KStat(Passkey, std::weak_ptr<detail::Session> session, native::RecordId id,
             const native::RecordHeader& header)
    : session_(std::move(session)),
      id_(id),
      module_(header.module),
      instance_(header.instance),
      name_(header.name),
      ks_class_(header.ks_class),
      type_(static_cast<KStatType>(header.type)),
      crtime_(header.crtime),
      snaptime_(header.snaptime) {}

Status KStat::refresh() {
    auto session = session_.lock();
    if (!session) {
        return closed_status();
    }
    std::lock_guard<std::mutex> lock(session->mutex);
    return refresh_locked(*session);
}

Status KStat::refresh_locked(detail::Session& session) {
    if (!session.handle) {
        return closed_status();
    }

    int err = session.handle->read(id_);
    if (err != 0) {
        spdlog::warn("kstat_read of {} failed: {}", to_string(), std::strerror(err));
        return Status::failure(ErrorCode::READ_FAILURE, "cannot read kstat " + to_string(), err);
    }

    int64_t snaptime = session.handle->header(id_).snaptime;
    if (snaptime >= snaptime_) {
        snaptime_ = snaptime;
    } else {
        spdlog::debug("Ignoring snaptime {} older than {} for {}", snaptime, snaptime_, to_string());
    }
    return Status{};
}

// Validity and type checks, plus the initial data load.
Status KStat::prepare_named_locked(detail::Session& session) {
    if (!session.handle) {
        return closed_status();
    }

    if (type_ != KStatType::NAMED) {
        return Status::failure(ErrorCode::TYPE_MISMATCH,
            "kstat " + to_string() + " (type " + kstat_type_to_string(type_) + ") is not a named kstat");
    }

    if (!session.handle->header(id_).has_data) {
        return refresh_locked(session);
    }
    return Status{};
}

NamedResult KStat::get_named(const std::string& name) {
    NamedResult result;

    auto session = session_.lock();
    if (!session) {
        result.status = closed_status();
        return result;
    }
    std::lock_guard<std::mutex> lock(session->mutex);

    result.status = prepare_named_locked(*session);
    if (!result.status.ok()) {
        return result;
    }

    auto raw = session->handle->named_lookup(id_, name);
    if (!raw) {
        result.status = Status::failure(ErrorCode::LOOKUP_FAILURE,
            "no statistic " + name + " in " + to_string(), ENOENT);
        return result;
    }
    return decode_named(*raw, shared_from_this());
}

NamedListResult KStat::all_named() {
    NamedListResult result;

    auto session = session_.lock();
    if (!session) {
        result.status = closed_status();
        return result;
    }
    std::lock_guard<std::mutex> lock(session->mutex);

    result.status = prepare_named_locked(*session);
    if (!result.status.ok()) {
        return result;
    }

    uint32_t ndata = session->handle->header(id_).ndata;
    auto self = shared_from_this();

    std::vector<Named> list;
    list.reserve(ndata);
    for (uint32_t i = 0; i < ndata; ++i) {
        auto raw = session->handle->named_at(id_, i);
        if (!raw) {
            result.status = Status::failure(ErrorCode::READ_FAILURE,
                "statistic " + std::to_string(i) + " of " + std::to_string(ndata) +
                " missing from " + to_string());
            return result;
        }

        auto decoded = decode_named(*raw, self);
        if (!decoded.status.ok()) {
            result.status = decoded.status;
            return result;
        }
        list.push_back(std::move(*decoded.named));
    }

    result.named = std::move(list);
    return result;
}

std::string KStat::to_string() const {
    return module_ + ":" + std::to_string(instance_) + ":" + name_ + " (" + ks_class_ + ")";
}

nlohmann::json KStat::to_json() const {
    return nlohmann::json{
        {"module", module_},
        {"instance", instance_},
        {"name", name_},
        {"class", ks_class_},
        {"type", kstat_type_to_string(type_)},
        {"crtime", crtime_},
        {"snaptime", snaptime_}
    };
}

} // namespace kstatpp::stats
