#pragma once
#include <vector>

#include "msg/RangeReading.hpp"

namespace platform {

// Downstream push of freshly committed raw readings.
// Best effort: the result is only reported, committed rows are never rolled back.
class IForwarder {
public:
    virtual bool forward(const std::vector<msg::StoredReading>& rows) = 0;
    virtual ~IForwarder() = default;
};

} // namespace platform
