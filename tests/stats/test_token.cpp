#include <cassert>
#include <cerrno>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include "core/logger.hpp"
#include "stats/kstat.hpp"
#include "stats/token.hpp"
#include "support/fake_subsystem.hpp"

using namespace kstatpp;
using namespace kstatpp::stats;
using namespace kstatpp::testing;

/*
================================================================================
Token — Unit Tests
================================================================================

Lifecycle of the access token and the KStat identity cache behind it:
  • open / close (idempotent, failing native close)
  • all() and lookup() share one KStat per kstat
  • lookup() reads data eagerly; failed reads keep the cache entry
  • everything native is refused after close, display still works
  • close() on one thread against lookups and refreshes on another
================================================================================
*/

static std::unique_ptr<Token> open_token(const std::shared_ptr<FakeSubsystem>& sub) {
    auto opened = Token::open(sub);
    assert(opened.status.ok());
    assert(opened.token);
    return std::move(opened.token);
}

// ============================================================================
// OPEN / CLOSE
// ============================================================================

void test_open_failure() {
    std::cout << "[TEST] Open failure is reported with errno..." << std::endl;

    auto sub = make_standard_subsystem();
    sub->chain().open_errno = EACCES;

    auto opened = Token::open(sub);
    assert(!opened.status.ok());
    assert(opened.status.code == ErrorCode::OPEN_FAILURE);
    assert(opened.status.sys_errno == EACCES);
    assert(!opened.token);

    auto no_sub = Token::open(std::shared_ptr<native::Subsystem>());
    assert(no_sub.status.code == ErrorCode::OPEN_FAILURE);
    assert(!no_sub.token);

    std::cout << "[TEST] OK\n";
}

void test_system_open_is_consistent() {
    std::cout << "[TEST] Platform open either succeeds or reports OPEN_FAILURE..." << std::endl;

    auto opened = Token::open();
    if (opened.status.ok()) {
        assert(opened.token);
        assert(opened.token->close().ok());
    } else {
        assert(opened.status.code == ErrorCode::OPEN_FAILURE);
        assert(!opened.token);
    }

    std::cout << "[TEST] OK\n";
}

void test_close_is_idempotent() {
    std::cout << "[TEST] Close twice is a no-op the second time..." << std::endl;

    auto sub = make_standard_subsystem();
    auto token = open_token(sub);
    assert(token->is_open());
    assert(!token->all().empty());
    assert(token->cached_count() == 4);

    assert(token->close().ok());
    assert(!token->is_open());
    assert(token->cached_count() == 0);
    assert(sub->chain().closes == 1);

    assert(token->close().ok());
    assert(sub->chain().closes == 1);

    std::cout << "[TEST] OK\n";
}

void test_close_failure_still_closes() {
    std::cout << "[TEST] Failing native close still drops the handle..." << std::endl;

    auto sub = make_standard_subsystem();
    sub->chain().close_errno = EIO;
    auto token = open_token(sub);
    token->all();

    Status st = token->close();
    assert(st.code == ErrorCode::CLOSE_FAILURE);
    assert(st.sys_errno == EIO);
    assert(!token->is_open());
    assert(token->cached_count() == 0);

    assert(token->close().ok());

    std::cout << "[TEST] OK\n";
}

void test_destructor_closes() {
    std::cout << "[TEST] Destroying an open token closes it..." << std::endl;

    auto sub = make_standard_subsystem();
    {
        auto token = open_token(sub);
        token->all();
    }
    assert(sub->chain().closes == 1);

    std::cout << "[TEST] OK\n";
}

// ============================================================================
// ENUMERATION & IDENTITY
// ============================================================================

void test_all_follows_chain_order() {
    std::cout << "[TEST] all() returns every kstat in chain order..." << std::endl;

    auto sub = make_standard_subsystem();
    auto token = open_token(sub);

    auto kstats = token->all();
    assert(kstats.size() == 4);
    assert(kstats[0]->to_string() == "cpu:0:sys (misc)");
    assert(kstats[1]->to_string() == "unix:0:system_misc (misc)");
    assert(kstats[2]->to_string() == "cpu_stat:0:cpu_stat0 (misc)");
    assert(kstats[3]->to_string() == "link:0:net0 (net)");
    assert(kstats[2]->type() == KStatType::RAW);
    assert(kstats[3]->ks_class() == "net");

    // Enumeration does not read data.
    assert(sub->chain().kstats[0].reads == 0);

    std::cout << "[TEST] OK\n";
}

void test_all_twice_returns_same_objects() {
    std::cout << "[TEST] Repeated all() returns identical KStat objects..." << std::endl;

    auto sub = make_standard_subsystem();
    auto token = open_token(sub);

    auto first = token->all();
    auto second = token->all();
    assert(first.size() == second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        assert(first[i].get() == second[i].get());
    }
    assert(token->cached_count() == first.size());

    std::cout << "[TEST] OK\n";
}

void test_lookup_reuses_enumerated_object() {
    std::cout << "[TEST] lookup() after all() returns the same KStat..." << std::endl;

    auto sub = make_standard_subsystem();
    auto token = open_token(sub);

    auto kstats = token->all();
    auto found = token->lookup("link", 0, "net0");
    assert(found.status.ok());
    assert(found.kstat.get() == kstats[3].get());

    auto again = token->lookup("link", 0, "net0");
    assert(again.kstat.get() == found.kstat.get());
    assert(token->cached_count() == 4);

    std::cout << "[TEST] OK\n";
}

void test_kstats_are_token_owned() {
    std::cout << "[TEST] KStats are created and shared only by their token..." << std::endl;

    static_assert(!std::is_default_constructible_v<KStat::Passkey>);
    static_assert(!std::is_copy_constructible_v<KStat>);
    static_assert(!std::is_copy_constructible_v<Token>);

    auto sub = make_standard_subsystem();
    auto token = open_token(sub);

    auto found = token->lookup("cpu", 0, "sys");
    assert(found.status.ok());
    assert(!found.kstat->weak_from_this().expired());
    assert(found.kstat->shared_from_this().get() == found.kstat.get());

    std::cout << "[TEST] OK\n";
}

void test_record_ids_are_opaque() {
    std::cout << "[TEST] Record ids compare and hash, nothing more..." << std::endl;

    static_assert(!std::is_constructible_v<native::RecordId, std::uintptr_t>);

    native::RecordId a;
    native::RecordId b;
    assert(a == b);
    assert(!(a != b));
    assert(native::RecordIdHash()(a) == native::RecordIdHash()(b));

    // Ids minted by the handle still key the cache: one KStat per kstat.
    auto sub = make_standard_subsystem();
    auto token = open_token(sub);
    auto first = token->all();
    auto second = token->all();
    assert(first.size() == 4);
    for (size_t i = 0; i < first.size(); ++i) {
        assert(first[i].get() == second[i].get());
        for (size_t j = i + 1; j < first.size(); ++j) {
            assert(first[i].get() != first[j].get());
        }
    }

    std::cout << "[TEST] OK\n";
}

void test_tokens_do_not_share_caches() {
    std::cout << "[TEST] Two tokens keep separate caches..." << std::endl;

    auto sub = make_standard_subsystem();
    auto a = open_token(sub);
    auto b = open_token(sub);

    auto ka = a->lookup("cpu", 0, "sys");
    auto kb = b->lookup("cpu", 0, "sys");
    assert(ka.status.ok() && kb.status.ok());
    assert(ka.kstat.get() != kb.kstat.get());

    assert(a->close().ok());
    assert(b->lookup("cpu", 0, "sys").status.ok());

    std::cout << "[TEST] OK\n";
}

// ============================================================================
// LOOKUP
// ============================================================================

void test_lookup_reads_data() {
    std::cout << "[TEST] lookup() reads the kstat before returning..." << std::endl;

    auto sub = make_standard_subsystem();
    auto token = open_token(sub);

    auto found = token->lookup("cpu", 0, "sys");
    assert(found.status.ok());
    assert(sub->chain().kstats[0].reads == 1);
    assert(found.kstat->snaptime() == sub->chain().kstats[0].header.snaptime);

    // Every lookup refreshes, cached or not.
    token->lookup("cpu", 0, "sys");
    assert(sub->chain().kstats[0].reads == 2);

    std::cout << "[TEST] OK\n";
}

void test_wildcard_lookup_takes_first() {
    std::cout << "[TEST] Wildcard lookup returns the first kstat..." << std::endl;

    auto sub = make_standard_subsystem();
    auto token = open_token(sub);

    auto found = token->lookup("", ANY_INSTANCE, "");
    assert(found.status.ok());
    assert(found.kstat->module() == "cpu");
    assert(found.kstat->name() == "sys");

    auto by_name = token->lookup("", ANY_INSTANCE, "net0");
    assert(by_name.status.ok());
    assert(by_name.kstat->module() == "link");

    std::cout << "[TEST] OK\n";
}

void test_lookup_not_found() {
    std::cout << "[TEST] lookup() of a missing kstat fails..." << std::endl;

    auto sub = make_standard_subsystem();
    auto token = open_token(sub);

    auto found = token->lookup("zfs", 3, "arcstats");
    assert(found.status.code == ErrorCode::LOOKUP_FAILURE);
    assert(found.status.sys_errno == ENOENT);
    assert(!found.kstat);
    assert(found.status.to_string().find("zfs:3:arcstats") != std::string::npos);
    assert(token->cached_count() == 0);

    std::cout << "[TEST] OK\n";
}

void test_failed_read_keeps_cache_entry() {
    std::cout << "[TEST] Failed read on lookup keeps the cached KStat..." << std::endl;

    auto sub = make_standard_subsystem();
    auto token = open_token(sub);
    sub->chain().kstats[3].read_errno = ENXIO;

    auto failed = token->lookup("link", 0, "net0");
    assert(failed.status.code == ErrorCode::READ_FAILURE);
    assert(failed.status.sys_errno == ENXIO);
    assert(!failed.kstat);
    assert(token->cached_count() == 1);

    // The kstat comes back; the same object is returned and re-read.
    sub->chain().kstats[3].read_errno = 0;
    auto ok = token->lookup("link", 0, "net0");
    assert(ok.status.ok());
    assert(token->cached_count() == 1);
    assert(token->all()[3].get() == ok.kstat.get());
    assert(sub->chain().kstats[3].reads == 2);

    std::cout << "[TEST] OK\n";
}

void test_token_get_named() {
    std::cout << "[TEST] Token::get_named composes lookup and get_named..." << std::endl;

    auto sub = make_standard_subsystem();
    auto token = open_token(sub);

    auto idle = token->get_named("cpu", 0, "sys", "idle");
    assert(idle.status.ok());
    assert(idle.named->name == "idle");
    assert(idle.named->type == NamedType::UINT64);
    assert(idle.named->uint_val == 4242);
    assert(idle.named->string_val.empty());
    assert(idle.named->int_val == 0);

    auto no_kstat = token->get_named("cpu", 7, "sys", "idle");
    assert(no_kstat.status.code == ErrorCode::LOOKUP_FAILURE);
    assert(!no_kstat.named);

    auto no_stat = token->get_named("cpu", 0, "sys", "nope");
    assert(no_stat.status.code == ErrorCode::LOOKUP_FAILURE);
    assert(!no_stat.named);

    std::cout << "[TEST] OK\n";
}

// ============================================================================
// AFTER CLOSE
// ============================================================================

void test_closed_token_rejects_native_calls() {
    std::cout << "[TEST] Closed token refuses lookups and refreshes..." << std::endl;

    auto sub = make_standard_subsystem();
    auto token = open_token(sub);

    auto sys = token->lookup("cpu", 0, "sys");
    auto idle = sys.kstat->get_named("idle");
    assert(idle.status.ok());
    int reads = sub->chain().kstats[0].reads;

    assert(token->close().ok());

    assert(token->lookup("cpu", 0, "sys").status.code == ErrorCode::CLOSED_TOKEN);
    assert(token->get_named("cpu", 0, "sys", "idle").status.code == ErrorCode::CLOSED_TOKEN);
    assert(token->all().empty());
    assert(sys.kstat->refresh().code == ErrorCode::CLOSED_TOKEN);
    assert(sys.kstat->get_named("idle").status.code == ErrorCode::CLOSED_TOKEN);
    assert(sys.kstat->all_named().status.code == ErrorCode::CLOSED_TOKEN);
    assert(sub->chain().kstats[0].reads == reads);

    // Already-copied data stays readable.
    assert(sys.kstat->to_string() == "cpu:0:sys (misc)");
    assert(idle.named->to_string() == "cpu:0:sys:idle");
    assert(idle.named->uint_val == 4242);

    std::cout << "[TEST] OK\n";
}

void test_destroyed_token_rejects_native_calls() {
    std::cout << "[TEST] KStat outliving its token refuses native calls..." << std::endl;

    auto sub = make_standard_subsystem();
    std::shared_ptr<KStat> sys;
    {
        auto token = open_token(sub);
        sys = token->lookup("cpu", 0, "sys").kstat;
        assert(sys);
    }

    assert(sys->refresh().code == ErrorCode::CLOSED_TOKEN);
    assert(sys->get_named("idle").status.code == ErrorCode::CLOSED_TOKEN);
    assert(sys->module() == "cpu");
    assert(sys->to_json()["class"] == "misc");

    std::cout << "[TEST] OK\n";
}

// ============================================================================
// CONCURRENCY
// ============================================================================

static bool ok_or_closed(const Status& status) {
    return status.ok() || status.code == ErrorCode::CLOSED_TOKEN;
}

void test_close_races_lookup_and_refresh() {
    std::cout << "[TEST] close() on one thread, lookups and refreshes on another..." << std::endl;

    auto sub = make_standard_subsystem();
    for (int round = 0; round < 200; ++round) {
        auto token = open_token(sub);
        auto sys = token->lookup("cpu", 0, "sys").kstat;
        assert(sys);

        std::vector<Status> seen;
        std::thread reader([&]() {
            seen.push_back(token->lookup("link", 0, "net0").status);
            seen.push_back(sys->refresh());
            seen.push_back(sys->all_named().status);
        });

        Status closed = token->close();
        reader.join();

        assert(closed.ok());
        assert(seen.size() == 3);
        for (const auto& status : seen) {
            assert(ok_or_closed(status));
        }
        assert(!token->is_open());
        assert(token->cached_count() == 0);
    }
    assert(sub->chain().closes == 200);

    std::cout << "[TEST] OK\n";
}

// ============================================================================
// MAIN
// ============================================================================

int main() {
    core::set_log_level(spdlog::level::debug);

    // Open / close
    test_open_failure();
    test_system_open_is_consistent();
    test_close_is_idempotent();
    test_close_failure_still_closes();
    test_destructor_closes();

    // Enumeration & identity
    test_all_follows_chain_order();
    test_all_twice_returns_same_objects();
    test_lookup_reuses_enumerated_object();
    test_tokens_do_not_share_caches();
    test_kstats_are_token_owned();
    test_record_ids_are_opaque();

    // Lookup
    test_lookup_reads_data();
    test_wildcard_lookup_takes_first();
    test_lookup_not_found();
    test_failed_read_keeps_cache_entry();
    test_token_get_named();

    // After close
    test_closed_token_rejects_native_calls();
    test_destroyed_token_rejects_native_calls();

    // Concurrency
    test_close_races_lookup_and_refresh();

    std::cout << "[TEST] ALL TOKEN TESTS PASSED!\n";
    return 0;
}
