#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "native/subsystem.hpp"
#include "stats/named.hpp"
#include "stats/types.hpp"

namespace kstatpp::stats {

namespace detail {
struct Session;
}

class Token;

/**
 * Access handle for one module:instance:name kstat.
 *
 * There is exactly one KStat per kstat per Token; repeated lookups return
 * the same object. The identity fields are copied at creation and stay
 * readable after the token is closed, but anything that needs the native
 * handle then fails with CLOSED_TOKEN.
 */
class KStat : public std::enable_shared_from_this<KStat> {
public:
    // Only a Token can create one, through std::make_shared
    class Passkey {
        friend class Token;
        Passkey() {}
    };

    KStat(Passkey, std::weak_ptr<detail::Session> session, native::RecordId id,
          const native::RecordHeader& header);

    KStat(const KStat&) = delete;
    KStat& operator=(const KStat&) = delete;

    const std::string& module() const { return module_; }
    int instance() const { return instance_; }
    const std::string& name() const { return name_; }

    // e.g. "net" or "disk"; kstat(1) shows it as the ":class" statistic
    const std::string& ks_class() const { return ks_class_; }

    KStatType type() const { return type_; }

    // Creation and snapshot times, ns since an arbitrary point (gethrtime(3C)).
    // snaptime is only meaningful once data has been read.
    int64_t crtime() const { return crtime_; }
    int64_t snaptime() const { return snaptime_; }

    /**
     * Re-read the statistics data (kstat_read()).
     *
     * Named values obtained earlier are not updated; fetch them again to
     * see new data. Not needed before get_named()/all_named(), which load
     * the data on first use.
     */
    Status refresh();

    // kstat_data_lookup() for one statistic. NAMED kstats only.
    NamedResult get_named(const std::string& name);

    // Every statistic, in native order. Either all of them or an error.
    NamedListResult all_named();

    // "<module>:<instance>:<name> (<class>)"
    std::string to_string() const;

    nlohmann::json to_json() const;

private:
    friend class Token;

    Status refresh_locked(detail::Session& session);
    Status prepare_named_locked(detail::Session& session);

    std::weak_ptr<detail::Session> session_;
    native::RecordId id_;

    std::string module_;
    int instance_;
    std::string name_;
    std::string ks_class_;
    KStatType type_;
    int64_t crtime_;
    int64_t snaptime_;
};

} // namespace kstatpp::stats
