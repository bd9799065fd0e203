#pragma once
#include <cstdint>
#include <string>

#include "msg/RangeReading.hpp"

namespace uwb {

// Field identifiers of the inline telemetry grammar.
enum class FieldId : uint8_t {
    TID = 0,
    RANGE,
    KX,
    KY,
    CMD,
    USER,
    NAME,
};

// One row of the field table. Labels are matched case-insensitively.
struct FieldSpec {
    const char* label;
    FieldId id;
    bool group;       // value is a parenthesised list "( ... )"
    bool mandatory;   // line is invalid without it
};

// ---------------------------------------------------------------------------
//  TelemetryParser
// ---------------------------------------------------------------------------
// Grammar: free text holding "label:value" pairs in any order, e.g.
//   AT+RANGE=tid:4,mask:01,seq:218,range:(100,110,103,0,0,0,0,0),kx:152.75,ky:101.3,cmd:2,user:user1
//
//   pair  := label ws* ':' ws* value
//   label := [A-Za-z_][A-Za-z0-9_]*   (whole word)
//   value := '(' <anything but ')'> ')' | <run up to ',' or whitespace>
//
// A value that itself reads as "label:" is empty ("user: cmd:1" leaves user
// empty and still yields cmd 1).
// Labels that are not in the field table (mask, seq, rssi, ...) are skipped.
// The first occurrence of a label wins.
class TelemetryParser {
public:
    // Returns false iff "tid" or "range" is missing. Bad numbers never fail the line:
    // they leave the slot absent. Pure; safe to call from any thread.
    bool parse(const std::string& line, uint64_t captured_at_us, msg::RawReading& out) const;

    // Numeric token: [+-]? (digits [. digits?] | . digits) ([eE][+-]?digits)?
    // "nan" (any case), empty and anything else return false.
    static bool parseNumber(const std::string& token, double& out);

    // Field table used by parse(); exposed for diagnostics.
    static const FieldSpec* fieldTable(std::size_t& count);
};

} // namespace uwb
