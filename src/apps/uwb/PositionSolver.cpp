// PositionSolver.cpp
#include "apps/uwb/PositionSolver.hpp"

#include <cmath>

#include <Eigen/Core>
#include <Eigen/LU>

namespace {

using EMat2 = Eigen::Matrix2d;
using EVec2 = Eigen::Vector2d;

inline void setWhy(uwb::PositionSolver::Status* why, uwb::PositionSolver::Status s) {
    if (why) *why = s;
}

} // namespace

namespace uwb {
// Internal sanitisation of config parameters
// not public API
static inline PositionSolverConfig sanitise(const PositionSolverConfig& in) {
    PositionSolverConfig cfg = in;

    if (!(cfg.SINGULAR_DET_EPS > 0.0)) cfg.SINGULAR_DET_EPS = 1e-9;
    if (cfg.MIN_ANCHORS < 3) cfg.MIN_ANCHORS = 3;   // 2D needs at least 3

    return cfg;
}

const char* PositionSolver::StatusStr(Status s) {
    switch (s) {
        case Status::OK: return "OK";
        case Status::NO_SPAN: return "NO_SPAN";
        case Status::TOO_FEW_ANCHORS: return "TOO_FEW_ANCHORS";
        case Status::SINGULAR: return "SINGULAR";
        default: return "UNKNOWN";
    }
}

PositionSolver::PositionSolver(const PositionSolverConfig& cfg)
    : m_cfg(sanitise(cfg)) {
}

void PositionSolver::setConfig(const PositionSolverConfig& cfg) {
    m_cfg = sanitise(cfg);
}

PositionSolver::Status PositionSolver::collectAnchors(const msg::CalibratedReading& reading,
                                                      std::vector<Anchor2D>& anchors) const {
    anchors.clear();

    const msg::RawReading& r = reading.reading;
    if (!r.has_span_x || !r.has_span_y || !(r.span_x > 0.0) || !(r.span_y > 0.0)) {
        return Status::NO_SPAN;
    }

    const double kx = r.span_x;
    const double ky = r.span_y;
    const std::array<std::array<double, 2>, NUM_CORNER_ANCHORS> corners = {{
        {0.0, 0.0},   // A0
        {kx,  0.0},   // A1
        {0.0, ky },   // A2
        {kx,  ky },   // A3
    }};

    for (std::size_t i = 0; i < NUM_CORNER_ANCHORS; ++i) {
        if (!reading.usable(i)) continue;
        if (!(r.dist[i] > 0.0)) continue;
        anchors.push_back({corners[i][0], corners[i][1], r.dist[i]});
    }
    return Status::OK;
}

bool PositionSolver::solve(const std::vector<Anchor2D>& anchors, double& x, double& y,
                           Status* why) const {
    if (anchors.size() < m_cfg.MIN_ANCHORS) {
        setWhy(why, Status::TOO_FEW_ANCHORS);
        return false;
    }

    // Linearise against the last anchor j. Subtracting circle j from circle i:
    //   2(xj - xi) x + 2(yj - yi) y = (di² - dj²) - (xi² + yi²) + (xj² + yj²)
    // Accumulate the normal equations AᵀA p = Aᵀb over all i != j.
    // With 3 anchors this is the exact intersection, with 4 the least-squares fix.
    const Anchor2D& ref = anchors.back();
    const double kj = ref.x * ref.x + ref.y * ref.y;

    EMat2 AtA = EMat2::Zero();
    EVec2 Atb = EVec2::Zero();

    for (std::size_t i = 0; i + 1 < anchors.size(); ++i) {
        const Anchor2D& a = anchors[i];
        const double ki = a.x * a.x + a.y * a.y;

        const EVec2 row(2.0 * (ref.x - a.x), 2.0 * (ref.y - a.y));
        const double b = (a.d * a.d - ref.d * ref.d) - ki + kj;

        AtA += row * row.transpose();
        Atb += row * b;
    }

    const double det = AtA.determinant();
    if (!std::isfinite(det) || std::fabs(det) < m_cfg.SINGULAR_DET_EPS) {
        setWhy(why, Status::SINGULAR);
        return false;
    }

    // 2x2 inverse is closed form in Eigen
    const EVec2 p = AtA.inverse() * Atb;
    if (!std::isfinite(p.x()) || !std::isfinite(p.y())) {
        setWhy(why, Status::SINGULAR);
        return false;
    }

    x = p.x();
    y = p.y();
    setWhy(why, Status::OK);
    return true;
}

bool PositionSolver::solveReading(const msg::CalibratedReading& reading,
                                  msg::ResolvedPosition& out, Status* why) const {
    std::vector<Anchor2D> anchors;
    const Status s = collectAnchors(reading, anchors);
    if (s != Status::OK) {
        setWhy(why, s);
        return false;
    }

    double x = 0.0;
    double y = 0.0;
    if (!solve(anchors, x, y, why)) return false;

    out.tag_id = reading.reading.tag_id;
    out.x = x;
    out.y = y;
    out.resolved_at_us = reading.reading.captured_at_us;
    return true;
}

} // namespace uwb
