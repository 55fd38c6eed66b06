#include "stats/token.hpp"
#include "stats/session.hpp"
#include <cstring>
#include <mutex>
#include <utility>
#include <spdlog/spdlog.h>

namespace kstatpp::stats {

namespace {

Status closed_status() {
    return Status::failure(ErrorCode::CLOSED_TOKEN, "token not valid or closed");
}

// "cpu:0:sys", with '*' for wildcards
std::string describe_query(const std::string& module, int instance, const std::string& name) {
    return (module.empty() ? "*" : module) + ":" +
           (instance == ANY_INSTANCE ? "*" : std::to_string(instance)) + ":" +
           (name.empty() ? "*" : name);
}

} // namespace

OpenResult Token::open() {
    return open(native::system_subsystem());
}

OpenResult Token::open(std::shared_ptr<native::Subsystem> subsystem) {
    OpenResult result;
    if (!subsystem) {
        result.status = Status::failure(ErrorCode::OPEN_FAILURE, "no kstat subsystem");
        return result;
    }

    std::unique_ptr<native::Handle> handle;
    int err = subsystem->open(handle);
    if (err != 0 || !handle) {
        result.status = Status::failure(ErrorCode::OPEN_FAILURE, "cannot open kstat", err);
        return result;
    }

    auto session = std::make_shared<detail::Session>();
    session->subsystem = std::move(subsystem);
    session->handle = std::move(handle);

    spdlog::debug("kstat token opened");
    result.token = std::make_unique<Token>(Passkey{}, std::move(session));
    return result;
}

Token::Token(Passkey, std::shared_ptr<detail::Session> session)
    : session_(std::move(session)) {}

Token::~Token() {
    Status status = close();
    if (!status.ok()) {
        spdlog::error("Closing kstat token on destruction: {}", status.to_string());
    }
}

Status Token::close() {
    std::lock_guard<std::mutex> lock(session_->mutex);
    if (!session_->handle) {
        return Status{};
    }

    int err = session_->handle->close();
    session_->handle.reset();

    size_t dropped = session_->cache.size();
    session_->cache.clear();
    spdlog::debug("kstat token closed, {} cached kstats dropped", dropped);

    if (err != 0) {
        spdlog::warn("kstat_close failed: {}", std::strerror(err));
        return Status::failure(ErrorCode::CLOSE_FAILURE, "kstat_close failed", err);
    }
    return Status{};
}

bool Token::is_open() const {
    std::lock_guard<std::mutex> lock(session_->mutex);
    return session_->handle != nullptr;
}

size_t Token::cached_count() const {
    std::lock_guard<std::mutex> lock(session_->mutex);
    return session_->cache.size();
}

std::shared_ptr<KStat> Token::intern_locked(native::RecordId id) {
    auto existing = session_->cache.find(id);
    if (existing) {
        return existing;
    }

    auto header = session_->handle->header(id);
    auto kstat = std::make_shared<KStat>(KStat::Passkey(), session_, id, header);
    spdlog::debug("Caching kstat {}", kstat->to_string());
    return session_->cache.insert(id, std::move(kstat));
}

std::vector<std::shared_ptr<KStat>> Token::all() {
    std::vector<std::shared_ptr<KStat>> kstats;

    std::lock_guard<std::mutex> lock(session_->mutex);
    if (!session_->handle) {
        return kstats;
    }

    for (auto id = session_->handle->chain_head(); id; id = session_->handle->chain_next(*id)) {
        kstats.push_back(intern_locked(*id));
    }
    return kstats;
}

LookupResult Token::lookup(const std::string& module, int instance, const std::string& name) {
    LookupResult result;

    std::lock_guard<std::mutex> lock(session_->mutex);
    if (!session_->handle) {
        result.status = closed_status();
        return result;
    }

    native::RecordId id;
    int err = session_->handle->lookup(module, instance, name, id);
    if (err != 0) {
        result.status = Status::failure(ErrorCode::LOOKUP_FAILURE,
            "no kstat matching " + describe_query(module, instance, name), err);
        return result;
    }

    auto kstat = intern_locked(id);

    // People rarely look up a kstat without wanting its data, so read it now.
    // A failed read does not evict the cache entry; the identity is still good.
    Status status = kstat->refresh_locked(*session_);
    if (!status.ok()) {
        result.status = status;
        return result;
    }

    result.kstat = std::move(kstat);
    return result;
}

NamedResult Token::get_named(const std::string& module, int instance,
                             const std::string& name, const std::string& stat) {
    auto found = lookup(module, instance, name);
    if (!found.status.ok()) {
        NamedResult result;
        result.status = found.status;
        return result;
    }
    return found.kstat->get_named(stat);
}

} // namespace kstatpp::stats
