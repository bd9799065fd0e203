#pragma once
#include <cstdint>
#include <string>

#include "msg/RangeReading.hpp"
#include "msg/ReportSession.hpp"
#include "platform/IRecordStore.hpp"

namespace core {

enum class SessionState : uint8_t {
    CLOSED,
    OPEN
};

// Inline command codes carried by "cmd:<n>"
enum class SessionCommand : int32_t {
    DISCARD = 0,   // reading is not stored/forwarded; no session effect
    OPEN    = 1,
    CLOSE   = 3
};

// What one reading did to the session table
enum class SessionEffect : uint8_t {
    NONE,
    OPENED,
    UPDATED,
    CLOSED
};

// ---------------------------------------------------------------------------
//  ReportSessionMachine
// ---------------------------------------------------------------------------
// Per-user CLOSED/OPEN machine. The state lives in the session table of the
// store ("open" = most recent row of the user without an end time), so the
// machine itself holds no per-user memory.
//
//   CLOSED --cmd 1--> OPEN     insert {started_at=now, span snapshot, name}
//   OPEN   --cmd 1--> OPEN     refresh non-null span/name values, backfill started_at
//   OPEN   --cmd 3--> CLOSED   ended_at=now
//   CLOSED --cmd 3--> CLOSED   no-op
// Readings without a user, and every other command, leave the table untouched.
class ReportSessionMachine {
public:
    explicit ReportSessionMachine(platform::IRecordStore& store);

    // Apply one reading. Returns false if the store failed a lookup or rejected a write;
    // the caller must then discard the transaction.
    bool update(const msg::RawReading& reading, uint64_t now_us, SessionEffect& effect);

    // Returns false on a storage fault.
    bool getState(const std::string& user, SessionState& state);

    static const char* getStateName(SessionState state);
    static const char* getEffectName(SessionEffect effect);

private:
    bool open(const msg::RawReading& reading, uint64_t now_us, SessionEffect& effect);
    bool close(const std::string& user, uint64_t now_us, SessionEffect& effect);

    platform::IRecordStore& m_store;
};

} // namespace core
