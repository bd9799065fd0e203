#pragma once
#include <string>
#include <vector>

#include "msg/RangeReading.hpp"

namespace uwb {

struct CalibrationConfig {
    // Systematic bias subtracted from every distance and span value
    double OFFSET = 40.0;

    // |calibrated - (0 - OFFSET)| below this is the "no reading" sentinel
    double SENTINEL_TOLERANCE = 1e-9;

    // Reserved tag ids that only ever produce calibration readings
    std::vector<std::string> CALIBRATION_TAGS = {"62"};
};

class CalibrationNormalizer {
public:
    explicit CalibrationNormalizer(const CalibrationConfig& cfg = {});
    void setConfig(const CalibrationConfig& cfg);
    const CalibrationConfig& getConfig() const { return m_cfg; }

    // Offset-correct one reading using the configured offset.
    msg::CalibratedReading normalize(const msg::RawReading& raw) const;

    // Same with an explicit offset (the configured tolerance and tags still apply).
    msg::CalibratedReading normalize(const msg::RawReading& raw, double offset) const;

    bool isCalibrationTag(const std::string& tag_id) const;

    // Calibrated value a raw zero turns into.
    double sentinel(double offset) const { return 0.0 - offset; }

private:
    CalibrationConfig m_cfg{};
};

} // namespace uwb
