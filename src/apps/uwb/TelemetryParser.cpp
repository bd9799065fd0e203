#include "apps/uwb/TelemetryParser.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <vector>

namespace {

constexpr uwb::FieldSpec FIELD_TABLE[] = {
    {"tid",   uwb::FieldId::TID,   false, true },
    {"range", uwb::FieldId::RANGE, true,  true },
    {"kx",    uwb::FieldId::KX,    false, false},
    {"ky",    uwb::FieldId::KY,    false, false},
    {"cmd",   uwb::FieldId::CMD,   false, false},
    {"user",  uwb::FieldId::USER,  false, false},
    {"name",  uwb::FieldId::NAME,  false, false},
};
constexpr std::size_t FIELD_COUNT = sizeof(FIELD_TABLE) / sizeof(FIELD_TABLE[0]);

inline bool isLabelStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

inline bool isLabelChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

inline bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && isSpace(s[b])) ++b;
    while (e > b && isSpace(s[e - 1])) --e;
    return s.substr(b, e - b);
}

std::string toLower(const std::string& s) {
    std::string out(s);
    for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

const uwb::FieldSpec* lookupField(const std::string& label) {
    const std::string key = toLower(label);
    for (std::size_t i = 0; i < FIELD_COUNT; ++i) {
        if (key == FIELD_TABLE[i].label) return &FIELD_TABLE[i];
    }
    return nullptr;
}

// True if a "label ws* :" starts at i.
bool pairStartsAt(const std::string& line, std::size_t i) {
    const std::size_t n = line.size();
    if (i >= n || !isLabelStart(line[i])) return false;
    while (i < n && isLabelChar(line[i])) ++i;
    while (i < n && isSpace(line[i])) ++i;
    return i < n && line[i] == ':';
}

// One "label:value" pair lifted from the line.
struct Pair {
    std::string label;
    std::string value;
    bool group = false;     // value came from "( ... )"
    bool closed = true;     // false if "(" had no matching ")"
};

// Tokenise the whole line into label:value pairs, left to right.
std::vector<Pair> scanPairs(const std::string& line) {
    std::vector<Pair> pairs;
    const std::size_t n = line.size();
    std::size_t i = 0;

    while (i < n) {
        // label must start on a word boundary
        if (!isLabelStart(line[i]) || (i > 0 && isLabelChar(line[i - 1]))) {
            ++i;
            continue;
        }

        std::size_t j = i;
        while (j < n && isLabelChar(line[j])) ++j;

        std::size_t k = j;
        while (k < n && isSpace(line[k])) ++k;
        if (k >= n || line[k] != ':') {
            i = j;
            continue;
        }
        ++k;
        while (k < n && isSpace(line[k])) ++k;

        Pair p;
        p.label = line.substr(i, j - i);

        if (k < n && line[k] == '(') {
            const std::size_t close = line.find(')', k + 1);
            p.group = true;
            if (close == std::string::npos) {
                p.closed = false;
                pairs.push_back(p);
                i = k + 1;
                continue;
            }
            p.value = line.substr(k + 1, close - (k + 1));
            pairs.push_back(p);
            i = close + 1;
            continue;
        }

        // "user: cmd:1": the next pair is not this value
        if (pairStartsAt(line, k)) {
            pairs.push_back(p);
            i = k;
            continue;
        }

        std::size_t e = k;
        while (e < n && line[e] != ',' && !isSpace(line[e])) ++e;
        p.value = line.substr(k, e - k);
        pairs.push_back(p);
        i = e;
    }
    return pairs;
}

// Leading digit run ("4", "62", "007"). Empty if the value does not start with a digit.
std::string leadingDigits(const std::string& value) {
    const std::string v = trim(value);
    std::size_t e = 0;
    while (e < v.size() && std::isdigit(static_cast<unsigned char>(v[e]))) ++e;
    return v.substr(0, e);
}

bool parseInt(const std::string& token, int32_t& out) {
    const std::string t = trim(token);
    std::size_t i = 0;
    if (i < t.size() && (t[i] == '+' || t[i] == '-')) ++i;
    if (i >= t.size()) return false;
    for (std::size_t k = i; k < t.size(); ++k) {
        if (!std::isdigit(static_cast<unsigned char>(t[k]))) return false;
    }
    char* end = nullptr;
    const long v = std::strtol(t.c_str(), &end, 10);
    if (end == t.c_str() || *end != '\0') return false;
    if (v > INT32_MAX || v < INT32_MIN) return false;
    out = static_cast<int32_t>(v);
    return true;
}

void parseRangeList(const std::string& list, msg::RawReading& out) {
    // Split on ',' keeping empty tokens, then right-pad / truncate to 8 slots
    std::vector<std::string> tokens;
    std::size_t start = 0;
    while (true) {
        const std::size_t comma = list.find(',', start);
        if (comma == std::string::npos) {
            tokens.push_back(list.substr(start));
            break;
        }
        tokens.push_back(list.substr(start, comma - start));
        start = comma + 1;
    }
    tokens.resize(msg::MAX_RANGE_SLOTS);

    out.dist_present = 0;
    for (std::size_t s = 0; s < msg::MAX_RANGE_SLOTS; ++s) {
        double v = 0.0;
        if (uwb::TelemetryParser::parseNumber(tokens[s], v)) {
            out.dist[s] = v;
            out.dist_present |= static_cast<uint8_t>(1u << s);
        } else {
            out.dist[s] = 0.0;
        }
    }
}

} // namespace

namespace uwb {

const FieldSpec* TelemetryParser::fieldTable(std::size_t& count) {
    count = FIELD_COUNT;
    return FIELD_TABLE;
}

bool TelemetryParser::parseNumber(const std::string& token, double& out) {
    const std::string t = trim(token);
    if (t.empty()) return false;
    if (toLower(t) == "nan") return false;

    std::size_t i = 0;
    const std::size_t n = t.size();
    if (t[i] == '+' || t[i] == '-') ++i;

    std::size_t int_digits = 0;
    while (i < n && std::isdigit(static_cast<unsigned char>(t[i]))) { ++i; ++int_digits; }

    std::size_t frac_digits = 0;
    if (i < n && t[i] == '.') {
        ++i;
        while (i < n && std::isdigit(static_cast<unsigned char>(t[i]))) { ++i; ++frac_digits; }
    }
    if (int_digits + frac_digits == 0) return false;

    if (i < n && (t[i] == 'e' || t[i] == 'E')) {
        ++i;
        if (i < n && (t[i] == '+' || t[i] == '-')) ++i;
        std::size_t exp_digits = 0;
        while (i < n && std::isdigit(static_cast<unsigned char>(t[i]))) { ++i; ++exp_digits; }
        if (exp_digits == 0) return false;
    }
    if (i != n) return false;

    char* end = nullptr;
    const double v = std::strtod(t.c_str(), &end);
    if (end == t.c_str() || *end != '\0' || !std::isfinite(v)) return false;

    out = v;
    return true;
}

bool TelemetryParser::parse(const std::string& line, uint64_t captured_at_us,
                            msg::RawReading& out) const {
    out = msg::RawReading{};
    out.captured_at_us = captured_at_us;

    bool seen[FIELD_COUNT] = {};
    bool have_tid = false;
    bool have_range = false;

    for (const Pair& p : scanPairs(line)) {
        const FieldSpec* spec = lookupField(p.label);
        if (!spec) continue;                                 // not ours (mask, seq, rssi, ...)

        const std::size_t idx = static_cast<std::size_t>(spec - FIELD_TABLE);
        if (seen[idx]) continue;                             // first occurrence wins
        if (spec->group != p.group || !p.closed) continue;   // wrong value shape
        seen[idx] = true;

        switch (spec->id) {
            case FieldId::TID: {
                // "tid:abc" does not count; a later numeric tid may still match
                out.tag_id = leadingDigits(p.value);
                have_tid = !out.tag_id.empty();
                seen[idx] = have_tid;
                break;
            }
            case FieldId::RANGE:
                parseRangeList(p.value, out);
                have_range = true;
                break;
            case FieldId::KX: {
                double v = 0.0;
                if (parseNumber(p.value, v)) { out.span_x = v; out.has_span_x = 1; }
                break;
            }
            case FieldId::KY: {
                double v = 0.0;
                if (parseNumber(p.value, v)) { out.span_y = v; out.has_span_y = 1; }
                break;
            }
            case FieldId::CMD: {
                int32_t c = 0;
                out.command = parseInt(p.value, c) ? c : 0;
                break;
            }
            case FieldId::USER:
                out.session_user = trim(p.value);
                break;
            case FieldId::NAME:
                out.session_name = trim(p.value);
                break;
        }
    }

    return have_tid && have_range;
}

} // namespace uwb
