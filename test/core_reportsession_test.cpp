// test/core_reportsession_test.cpp
//
// ReportSessionMachine over an InMemoryRecordStore:
//   CLOSED -1-> OPEN -1-> OPEN -3-> CLOSED -3-> CLOSED, per user.

#include <iostream>
#include <string>

#include "apps/core/ReportSessionMachine.hpp"
#include "platform/memory/InMemoryRecordStore.hpp"

static int g_failures = 0;

static void check(bool cond, const std::string& what) {
    if (cond) {
        std::cout << "[TEST] PASS " << what << "\n";
    } else {
        std::cerr << "[TEST] FAIL " << what << "\n";
        ++g_failures;
    }
}

static core::SessionState stateOf(core::ReportSessionMachine& machine, const std::string& user) {
    core::SessionState st = core::SessionState::CLOSED;
    if (!machine.getState(user, st)) {
        std::cerr << "[TEST] getState storage fault\n";
        ++g_failures;
    }
    return st;
}

// Store whose next open-session lookups fail
class LookupFaultStore : public platform::InMemoryRecordStore {
public:
    bool findOpenSession(const std::string& user, msg::ReportSession& out, bool& found) override {
        if (fail_lookups > 0) {
            --fail_lookups;
            found = false;
            return false;
        }
        return platform::InMemoryRecordStore::findOpenSession(user, out, found);
    }

    int fail_lookups = 0;
};

static msg::RawReading reading(const std::string& user, int32_t cmd) {
    msg::RawReading r{};
    r.tag_id = "4";
    r.session_user = user;
    r.command = cmd;
    return r;
}

static void testLifecycle() {
    platform::InMemoryRecordStore store;
    core::ReportSessionMachine machine(store);
    core::SessionEffect effect = core::SessionEffect::NONE;

    check(stateOf(machine, "alice") == core::SessionState::CLOSED, "initially closed");

    msg::RawReading r = reading("alice", 1);
    r.has_span_x = 1; r.span_x = 112.75;
    check(machine.update(r, 1000, effect) && effect == core::SessionEffect::OPENED, "cmd 1 opens");
    check(stateOf(machine, "alice") == core::SessionState::OPEN, "alice open");

    auto rows = store.sessions();
    check(rows.size() == 1 && rows[0].has_started && rows[0].started_at_us == 1000,
          "started_at recorded");
    check(rows[0].has_span_x && rows[0].span_x == 112.75 && !rows[0].has_span_y,
          "span snapshot taken, missing ky stays null");

    // Refresh: ky arrives, kx absent must not clear the stored kx
    msg::RawReading u = reading("alice", 1);
    u.has_span_y = 1; u.span_y = 61.3;
    check(machine.update(u, 2000, effect) && effect == core::SessionEffect::UPDATED, "cmd 1 on open updates");
    rows = store.sessions();
    check(rows.size() == 1, "no second open row");
    check(rows[0].has_span_x && rows[0].span_x == 112.75 && rows[0].has_span_y && rows[0].span_y == 61.3,
          "non-null values refreshed, nothing cleared");
    check(rows[0].started_at_us == 1000, "started_at not moved by an update");

    check(machine.update(reading("alice", 3), 3000, effect) && effect == core::SessionEffect::CLOSED,
          "cmd 3 closes");
    rows = store.sessions();
    check(rows[0].has_ended && rows[0].ended_at_us == 3000, "ended_at recorded");
    check(stateOf(machine, "alice") == core::SessionState::CLOSED, "alice closed");

    check(machine.update(reading("alice", 3), 4000, effect) && effect == core::SessionEffect::NONE,
          "cmd 3 with nothing open is a no-op");
    check(store.sessions().size() == 1 && store.sessions()[0].ended_at_us == 3000,
          "closed session untouched");

    check(machine.update(reading("alice", 1), 5000, effect) && effect == core::SessionEffect::OPENED,
          "reopen after close");
    rows = store.sessions();
    check(rows.size() == 2 && rows[1].isOpen() && rows[1].session_id != rows[0].session_id,
          "reopen inserts a new row");
}

static void testIgnoredReadings() {
    platform::InMemoryRecordStore store;
    core::ReportSessionMachine machine(store);
    core::SessionEffect effect = core::SessionEffect::OPENED;

    check(machine.update(reading("", 1), 1, effect) && effect == core::SessionEffect::NONE,
          "no user: no effect");
    check(machine.update(reading("bob", 0), 1, effect) && effect == core::SessionEffect::NONE,
          "cmd 0: no effect");
    check(machine.update(reading("bob", 2), 1, effect) && effect == core::SessionEffect::NONE,
          "cmd 2: no effect");
    check(machine.update(reading("bob", -1), 1, effect) && effect == core::SessionEffect::NONE,
          "negative cmd: no effect");
    check(store.sessions().empty(), "table untouched");
}

static void testUsersIndependent() {
    platform::InMemoryRecordStore store;
    core::ReportSessionMachine machine(store);
    core::SessionEffect effect = core::SessionEffect::NONE;

    (void)machine.update(reading("alice", 1), 10, effect);
    (void)machine.update(reading("bob", 1), 20, effect);
    check(machine.update(reading("bob", 3), 30, effect) && effect == core::SessionEffect::CLOSED,
          "bob closes");
    check(stateOf(machine, "alice") == core::SessionState::OPEN, "alice still open");
    check(stateOf(machine, "bob") == core::SessionState::CLOSED, "bob closed");
}

static void testSpanTextRoundTrip() {
    platform::InMemoryRecordStore store;
    core::ReportSessionMachine machine(store);
    core::SessionEffect effect = core::SessionEffect::NONE;

    msg::RawReading r = reading("carol", 1);
    r.has_span_x = 1; r.span_x = 0.1 + 0.2;
    r.has_span_y = 1; r.span_y = 1.0 / 3.0;
    (void)machine.update(r, 1, effect);

    const auto rows = store.sessions();
    check(rows.size() == 1 && rows[0].span_x == 0.1 + 0.2 && rows[0].span_y == 1.0 / 3.0,
          "spans survive the text columns exactly");
}

static void testLookupFaultIsReported() {
    LookupFaultStore store;
    core::ReportSessionMachine machine(store);
    core::SessionEffect effect = core::SessionEffect::NONE;

    check(machine.update(reading("alice", 1), 10, effect) && effect == core::SessionEffect::OPENED,
          "alice opens");

    store.fail_lookups = 1;
    effect = core::SessionEffect::OPENED;
    check(!machine.update(reading("alice", 1), 20, effect), "cmd 1 with a failed lookup fails");
    check(effect == core::SessionEffect::NONE, "no effect reported");

    int open_rows = 0;
    for (const auto& s : store.sessions()) {
        if (s.user == "alice" && s.isOpen()) ++open_rows;
    }
    check(open_rows == 1, "no second open session inserted");

    store.fail_lookups = 1;
    check(!machine.update(reading("alice", 3), 30, effect), "cmd 3 with a failed lookup fails");
    check(store.sessions().size() == 1 && store.sessions()[0].isOpen(), "session not closed");

    store.fail_lookups = 1;
    core::SessionState st = core::SessionState::OPEN;
    check(!machine.getState("alice", st), "getState reports the fault");

    check(machine.update(reading("alice", 3), 40, effect) && effect == core::SessionEffect::CLOSED,
          "close works once the store recovers");
}

static void testSessionName() {
    platform::InMemoryRecordStore store;
    core::ReportSessionMachine machine(store);
    core::SessionEffect effect = core::SessionEffect::NONE;

    msg::RawReading r = reading("frank", 1);
    r.session_name = "Morning round";
    (void)machine.update(r, 1, effect);
    check(store.sessions().size() == 1 && store.sessions()[0].name == "Morning round",
          "name stored on open");

    (void)machine.update(reading("frank", 1), 2, effect);
    check(store.sessions()[0].name == "Morning round", "update without name keeps it");

    r.session_name = "Evening round";
    (void)machine.update(r, 3, effect);
    check(store.sessions()[0].name == "Evening round", "update with name refreshes it");
}

static void testNames() {
    check(std::string(core::ReportSessionMachine::getStateName(core::SessionState::OPEN)) == "OPEN",
          "state name");
    check(std::string(core::ReportSessionMachine::getEffectName(core::SessionEffect::UPDATED)) == "UPDATED",
          "effect name");
}

int main() {
    std::cout << "=== REPORT SESSION TEST ===\n";

    testLifecycle();
    testIgnoredReadings();
    testUsersIndependent();
    testSpanTextRoundTrip();
    testLookupFaultIsReported();
    testSessionName();
    testNames();

    if (g_failures) {
        std::cerr << "[TEST] " << g_failures << " check(s) failed\n";
        return 1;
    }
    std::cout << "[TEST] all checks passed\n";
    return 0;
}
