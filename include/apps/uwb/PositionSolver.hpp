#pragma once
#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>

#include "msg/RangeReading.hpp"
#include "msg/PositionRecord.hpp"

namespace uwb {

// One anchor with the measured tag distance.
struct Anchor2D {
    double x = 0.0;
    double y = 0.0;
    double d = 0.0;
};

// Rectangle corners: 0=(0,0) 1=(kx,0) 2=(0,ky) 3=(kx,ky).
// Distance slots 4..7 have no anchor assigned.
constexpr std::size_t NUM_CORNER_ANCHORS = 4;

struct PositionSolverConfig {
    // |det(AᵀA)| below this is treated as singular
    double SINGULAR_DET_EPS = 1e-9;

    // Minimum anchors needed for a 2D fix
    std::size_t MIN_ANCHORS = 3;
};

class PositionSolver {
public:
    enum class Status : uint8_t {
        OK = 0,
        NO_SPAN,            // kx/ky absent or not strictly positive
        TOO_FEW_ANCHORS,    // fewer than MIN_ANCHORS usable distances
        SINGULAR,           // anchors (nearly) collinear or coincident
    };

    static const char* StatusStr(Status s);

    explicit PositionSolver(const PositionSolverConfig& cfg = {});
    void setConfig(const PositionSolverConfig& cfg);
    const PositionSolverConfig& getConfig() const { return m_cfg; }

    // Core API: least-squares multilateration over an explicit anchor list.
    // Returns false (never throws) if the system cannot be solved; 'why' gets the reason.
    bool solve(const std::vector<Anchor2D>& anchors, double& x, double& y,
               Status* why = nullptr) const;

    // Build the corner anchors of a calibrated reading and solve.
    // A corner is used if its distance is present, not a sentinel and > 0.
    bool solveReading(const msg::CalibratedReading& reading, msg::ResolvedPosition& out,
                      Status* why = nullptr) const;

    // Usable corner anchors of a reading, in corner order.
    // Returns NO_SPAN when the rectangle is undefined.
    Status collectAnchors(const msg::CalibratedReading& reading,
                          std::vector<Anchor2D>& anchors) const;

private:
    PositionSolverConfig m_cfg{};
};

} // namespace uwb
