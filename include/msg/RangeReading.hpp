#pragma once
#include <cstdint>
#include <cstddef>
#include <array>
#include <string>

namespace msg {

// Fixed slot count of a telemetry range list: A0..A7.
// Slots 0..3 map to the rectangle corners; 4..7 are carried but reserved.
constexpr std::size_t MAX_RANGE_SLOTS = 8;

// Bit i of a slot mask refers to distance slot i.
inline bool slotSet(uint8_t mask, std::size_t i) { return (mask >> i) & 0x1u; }

// One decoded telemetry line, values exactly as received.
struct RawReading {
    std::string tag_id;                               // numeric id kept as text ("4", "62")

    std::array<double, MAX_RANGE_SLOTS> dist{};       // slot values; meaningful only where present
    uint8_t dist_present = 0;                         // bit i = 1 if slot i carried a number

    double  span_x = 0.0;                             // kx: anchor rectangle width
    double  span_y = 0.0;                             // ky: anchor rectangle height
    uint8_t has_span_x = 0;
    uint8_t has_span_y = 0;

    int32_t command = 0;                              // cmd (0 when absent)
    std::string session_user;                         // user, empty when absent
    std::string session_name;                         // name: session display name, empty when absent

    uint64_t captured_at_us = 0;                      // wall clock at ingest
};

// RawReading after offset correction.
// Values keep the subtracted number (the no-reading sentinel included, e.g. -40.0);
// no_reading marks slots that must be treated as absent for solving.
struct CalibratedReading {
    RawReading reading;                               // values already offset-corrected

    uint8_t no_reading = 0;                           // bit i = 1 if slot i equals the sentinel
    uint8_t calibration_tag = 0;                      // 1 if tag_id is a reserved calibration id
    double  offset = 0.0;                             // offset that was applied

    // Present and not a sentinel.
    bool usable(std::size_t slot) const {
        return slotSet(reading.dist_present, slot) && !slotSet(no_reading, slot);
    }
};

// A calibrated reading once the store has assigned it a row id.
struct StoredReading {
    uint64_t id = 0;
    CalibratedReading reading;
};

} // namespace msg
