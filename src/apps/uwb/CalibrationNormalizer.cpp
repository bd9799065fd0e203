#include "apps/uwb/CalibrationNormalizer.hpp"

#include <algorithm>
#include <cmath>

namespace uwb {
// Internal sanitisation of config parameters
// not public API
static inline CalibrationConfig sanitise(const CalibrationConfig& in) {
    CalibrationConfig cfg = in;

    if (!(cfg.SENTINEL_TOLERANCE > 0.0)) cfg.SENTINEL_TOLERANCE = 1e-9;
    if (!std::isfinite(cfg.OFFSET)) cfg.OFFSET = 0.0;

    return cfg;
}

CalibrationNormalizer::CalibrationNormalizer(const CalibrationConfig& cfg)
    : m_cfg(sanitise(cfg)) {
}

void CalibrationNormalizer::setConfig(const CalibrationConfig& cfg) {
    m_cfg = sanitise(cfg);
}

bool CalibrationNormalizer::isCalibrationTag(const std::string& tag_id) const {
    return std::find(m_cfg.CALIBRATION_TAGS.begin(), m_cfg.CALIBRATION_TAGS.end(), tag_id)
           != m_cfg.CALIBRATION_TAGS.end();
}

msg::CalibratedReading CalibrationNormalizer::normalize(const msg::RawReading& raw) const {
    return normalize(raw, m_cfg.OFFSET);
}

msg::CalibratedReading CalibrationNormalizer::normalize(const msg::RawReading& raw,
                                                        double offset) const {
    msg::CalibratedReading out{};
    out.reading = raw;
    out.offset = offset;
    out.calibration_tag = isCalibrationTag(raw.tag_id) ? 1 : 0;

    const double s = sentinel(offset);

    for (std::size_t i = 0; i < msg::MAX_RANGE_SLOTS; ++i) {
        if (!msg::slotSet(raw.dist_present, i)) continue;

        const double v = raw.dist[i] - offset;
        out.reading.dist[i] = v;
        if (std::fabs(v - s) < m_cfg.SENTINEL_TOLERANCE) {
            out.no_reading |= static_cast<uint8_t>(1u << i);
        }
    }

    if (raw.has_span_x) out.reading.span_x = raw.span_x - offset;
    if (raw.has_span_y) out.reading.span_y = raw.span_y - offset;

    return out;
}

} // namespace uwb
