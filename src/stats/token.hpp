/**
 * kstatpp access token
 *
 * A Token wraps one open kstat_ctl_t. Open it, look kstats up through it,
 * and close() it when done. After close() the KStat and Named objects
 * obtained through it stay readable (fields, to_string(), to_json()), but
 * every call that needs the kernel fails with CLOSED_TOKEN.
 *
 * Calls on one token are serialized internally; a concurrent close() waits
 * for any in-flight lookup or refresh.
 */
#pragma once
#include <memory>
#include <string>
#include <vector>
#include "native/subsystem.hpp"
#include "stats/kstat.hpp"
#include "stats/named.hpp"
#include "stats/types.hpp"

namespace kstatpp::stats {

namespace detail {
struct Session;
}

class Token;

struct OpenResult {
    Status status;
    std::unique_ptr<Token> token;
};

struct LookupResult {
    Status status;
    std::shared_ptr<KStat> kstat;
};

class Token {
    // Restricts construction to open() while keeping std::make_unique usable
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    // kstat_open() on this platform's kstat facility
    static OpenResult open();

    // Open against a specific subsystem
    static OpenResult open(std::shared_ptr<native::Subsystem> subsystem);

    Token(Passkey, std::shared_ptr<detail::Session> session);
    ~Token();

    // Non-copyable
    Token(const Token&) = delete;
    Token& operator=(const Token&) = delete;

    /**
     * kstat_close(). Drops the handle and every cached KStat.
     * A closed token cannot be reopened; closing it again is a no-op.
     */
    Status close();

    bool is_open() const;

    // Every kstat on the chain, in chain order. Empty once closed.
    std::vector<std::shared_ptr<KStat>> all();

    /**
     * kstat_lookup(). module and name may be "" and instance ANY_INSTANCE
     * to take the first kstat that matches the rest.
     *
     * The kstat's data is read before returning; if that read fails the
     * lookup fails with READ_FAILURE (the KStat itself stays cached).
     */
    LookupResult lookup(const std::string& module, int instance, const std::string& name);

    // lookup() followed by KStat::get_named()
    NamedResult get_named(const std::string& module, int instance,
                          const std::string& name, const std::string& stat);

    // Number of distinct kstats wrapped so far
    size_t cached_count() const;

private:
    // Cached KStat for id, created on first sight. Caller holds the lock.
    std::shared_ptr<KStat> intern_locked(native::RecordId id);

    std::shared_ptr<detail::Session> session_;
};

} // namespace kstatpp::stats
