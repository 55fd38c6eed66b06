/**
 * kstatpp native seam - platforms without libkstat
 *
 * Every open fails with ENOTSUP; callers get OPEN_FAILURE.
 */

#include "native/subsystem.hpp"
#include <cerrno>
#include <spdlog/spdlog.h>

namespace kstatpp::native {

namespace {

class UnsupportedSubsystem : public Subsystem {
public:
    int open(std::unique_ptr<Handle>& out) override {
        out.reset();
        spdlog::warn("kstat facility is not available on this platform");
        return ENOTSUP;
    }
};

} // namespace

std::shared_ptr<Subsystem> system_subsystem() {
    return std::make_shared<UnsupportedSubsystem>();
}

} // namespace kstatpp::native
