#pragma once
#include <cstdint>
#include <string>

namespace msg {

// A user-scoped report interval opened by cmd 1 and closed by cmd 3.
// "Open" means has_ended == 0. At most one open session per user.
struct ReportSession {
    uint64_t session_id = 0;          // assigned by the store on insert
    std::string user;
    std::string name;                 // optional display name, empty if unset

    uint8_t  has_started = 0;
    uint64_t started_at_us = 0;
    uint8_t  has_ended = 0;
    uint64_t ended_at_us = 0;

    // Span snapshot taken from the telemetry that opened/updated the session
    uint8_t has_span_x = 0;
    double  span_x = 0.0;
    uint8_t has_span_y = 0;
    double  span_y = 0.0;

    bool isOpen() const { return has_ended == 0; }
};

} // namespace msg
