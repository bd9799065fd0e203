#include "apps/core/ReportSessionMachine.hpp"

#include <iostream>

namespace core {

ReportSessionMachine::ReportSessionMachine(platform::IRecordStore& store)
    : m_store(store) {}

bool ReportSessionMachine::update(const msg::RawReading& reading, uint64_t now_us,
                                  SessionEffect& effect) {
    effect = SessionEffect::NONE;
    if (reading.session_user.empty()) return true;

    switch (static_cast<SessionCommand>(reading.command)) {
        case SessionCommand::OPEN:
            return open(reading, now_us, effect);
        case SessionCommand::CLOSE:
            return close(reading.session_user, now_us, effect);
        default:
            return true;
    }
}

bool ReportSessionMachine::open(const msg::RawReading& reading, uint64_t now_us,
                                SessionEffect& effect) {
    msg::ReportSession s{};
    bool found = false;

    if (!m_store.findOpenSession(reading.session_user, s, found)) {
        std::cerr << "[SESSION] lookup failed user=" << reading.session_user << "\n";
        return false;
    }

    if (found) {
        // Already open: refresh in place, never clear a value
        if (reading.has_span_x) { s.has_span_x = 1; s.span_x = reading.span_x; }
        if (reading.has_span_y) { s.has_span_y = 1; s.span_y = reading.span_y; }
        if (!reading.session_name.empty()) s.name = reading.session_name;
        if (!s.has_started) { s.has_started = 1; s.started_at_us = now_us; }

        if (!m_store.updateSession(s)) {
            std::cerr << "[SESSION] update failed user=" << s.user << " id=" << s.session_id << "\n";
            return false;
        }
        effect = SessionEffect::UPDATED;
        return true;
    }

    s.user = reading.session_user;
    s.name = reading.session_name;
    s.has_started = 1;
    s.started_at_us = now_us;
    s.has_span_x = reading.has_span_x;
    s.span_x = reading.span_x;
    s.has_span_y = reading.has_span_y;
    s.span_y = reading.span_y;

    if (!m_store.insertSession(s)) {
        std::cerr << "[SESSION] insert failed user=" << s.user << "\n";
        return false;
    }
    effect = SessionEffect::OPENED;
    return true;
}

bool ReportSessionMachine::close(const std::string& user, uint64_t now_us,
                                 SessionEffect& effect) {
    msg::ReportSession s{};
    bool found = false;
    if (!m_store.findOpenSession(user, s, found)) {
        std::cerr << "[SESSION] lookup failed user=" << user << "\n";
        return false;
    }
    if (!found) return true;   // nothing open

    s.has_ended = 1;
    s.ended_at_us = now_us;
    if (!m_store.updateSession(s)) {
        std::cerr << "[SESSION] close failed user=" << user << " id=" << s.session_id << "\n";
        return false;
    }
    effect = SessionEffect::CLOSED;
    return true;
}

bool ReportSessionMachine::getState(const std::string& user, SessionState& state) {
    msg::ReportSession s{};
    bool found = false;
    if (!m_store.findOpenSession(user, s, found)) return false;
    state = found ? SessionState::OPEN : SessionState::CLOSED;
    return true;
}

// Return a human-readable state name for logging/Debugging
const char* ReportSessionMachine::getStateName(SessionState state) {
    switch (state) {
        case SessionState::CLOSED: return "CLOSED";
        case SessionState::OPEN: return "OPEN";
        default: return "UNKNOWN";
    }
}

const char* ReportSessionMachine::getEffectName(SessionEffect effect) {
    switch (effect) {
        case SessionEffect::NONE: return "NONE";
        case SessionEffect::OPENED: return "OPENED";
        case SessionEffect::UPDATED: return "UPDATED";
        case SessionEffect::CLOSED: return "CLOSED";
        default: return "UNKNOWN";
    }
}

} // namespace core
