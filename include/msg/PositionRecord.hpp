#pragma once
#include <cstdint>
#include <string>

namespace msg {

// Tag fix in the anchor rectangle frame: A0 at origin, x along A0->A1, y along A0->A2.
// Same length unit as the calibrated distances.
struct ResolvedPosition {
    std::string tag_id;
    double x = 0.0;
    double y = 0.0;
    uint64_t resolved_at_us = 0;
};

// Row written on the processing path.
// has_motion = 0 on the first fix of a tag: distance_travelled/elapsed_s are null then.
struct ProcessedRecord {
    uint64_t id = 0;                  // assigned by the store
    std::string tag_id;
    double x = 0.0;
    double y = 0.0;

    uint8_t  has_motion = 0;
    double   distance_travelled = 0.0;
    int64_t  elapsed_s = 0;

    uint64_t recorded_at_us = 0;
};

} // namespace msg
