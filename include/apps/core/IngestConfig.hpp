#pragma once
#include <cstdint>
#include <string>

#include "apps/uwb/CalibrationNormalizer.hpp"
#include "apps/uwb/PositionSolver.hpp"
#include "platform/linux/UdpForwarder.hpp"

namespace core {

enum class IngestMode : uint8_t {
    RAW_INGEST = 0,   // store calibrated readings, forward the committed batch
    PROCESS = 1,      // solve positions, store processed records
};

struct IngestConfig {
    uwb::CalibrationConfig CALIBRATION{};
    uwb::PositionSolverConfig SOLVER{};

    IngestMode MODE = IngestMode::RAW_INGEST;

    // Downstream push of committed raw rows
    bool FORWARD_ENABLED = false;
    platform::UdpForwarderConfig FORWARD{};

    // Reader side: a batch is cut at a blank line or after this many lines
    uint32_t BATCH_MAX_LINES = 256;

    // Per-row log lines
    bool VERBOSE = false;
};

// Replace out-of-range values with safe defaults.
IngestConfig sanitise(const IngestConfig& in);

// Read a YAML/JSON/XML config through cv::FileStorage. Keys that are missing keep
// the value already in 'cfg'. Returns false if the file cannot be opened or parsed.
//
//   calibration_offset: 40.0
//   sentinel_tolerance: 1.0e-9
//   calibration_tags: [ "62" ]
//   singular_det_eps: 1.0e-9
//   mode: "raw"            # or "process"
//   batch_max_lines: 256
//   verbose: 0
//   forward:
//     enabled: 1
//     host: "127.0.0.1"
//     port: 9750
//     timeout_ms: 500
bool loadConfig(const std::string& path, IngestConfig& cfg);

const char* modeName(IngestMode mode);
bool parseMode(const std::string& text, IngestMode& mode);

} // namespace core
