#pragma once
#include <memory>
#include <mutex>
#include "native/subsystem.hpp"
#include "stats/cache.hpp"

namespace kstatpp::stats::detail {

// State shared between a Token and the KStats it hands out. KStats hold it
// weakly, so they notice both close() and destruction of the token.
// handle == nullptr means closed; checking it, touching the cache and calling
// into the handle all happen under mutex.
struct Session {
    std::shared_ptr<native::Subsystem> subsystem;
    std::unique_ptr<native::Handle> handle;
    KStatCache cache;
    std::mutex mutex;
};

} // namespace kstatpp::stats::detail
