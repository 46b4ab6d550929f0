#pragma once

#include "Common.hpp"
#include <vector>

namespace ipmicurve {

/**
 * Maps a temperature onto a compiled curve.
 * Picks the first segment (ascending) whose upper bound is >= temp, or the
 * last segment above the top setpoint. The result is rounded half away from
 * zero, then clamped to bounds.
 */
int evaluateCurve(double temp, const std::vector<Segment>& segments, const DutyBounds& bounds);

class CurveEvaluator {
public:
    CurveEvaluator(std::vector<Segment> segments, DutyBounds bounds);

    int evaluate(double temp) const;

    const std::vector<Segment>& getSegments() const { return segments_; }
    const DutyBounds& getBounds() const { return bounds_; }

private:
    std::vector<Segment> segments_;
    DutyBounds bounds_;
};

} // namespace ipmicurve
