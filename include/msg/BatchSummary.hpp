#pragma once
#include <cstdint>

namespace msg {

// Counters returned to the caller for one ingest batch.
struct BatchSummary {
    uint32_t received_lines = 0;              // non-blank lines offered

    uint32_t saved = 0;                       // rows committed (0 if the commit failed)
    uint32_t skipped_invalid = 0;             // no tid or no range list
    uint32_t skipped_calibration = 0;         // reserved calibration tag
    uint32_t skipped_command_zero = 0;        // cmd 0 / no cmd
    uint32_t skipped_unsolvable = 0;          // processing path: < 3 anchors or singular

    uint32_t sessions_opened_or_updated = 0;
    uint32_t sessions_closed = 0;

    uint8_t forwarded_ok = 0;                 // raw path only: downstream push succeeded
    double  calibration_offset = 0.0;
};

} // namespace msg
