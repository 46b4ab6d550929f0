#include "CurveEvaluator.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace ipmicurve {

int evaluateCurve(double temp, const std::vector<Segment>& segments, const DutyBounds& bounds) {
    if (segments.empty()) return bounds.min;

    auto it = std::find_if(segments.begin(), segments.end(),
                           [temp](const Segment& s) { return s.upperBound >= temp; });
    const Segment& segment = (it != segments.end()) ? *it : segments.back();

    double raw = std::round(segment.slope * temp + segment.intercept);
    if (raw < bounds.min) return bounds.min;
    if (raw > bounds.max) return bounds.max;
    return static_cast<int>(raw);
}

CurveEvaluator::CurveEvaluator(std::vector<Segment> segments, DutyBounds bounds)
    : segments_(std::move(segments)), bounds_(bounds) {
    if (segments_.empty()) {
        throw ConfigurationError("Fan curve has no segments");
    }
    if (bounds_.min > bounds_.max) {
        throw ConfigurationError("Duty cycle bounds are inverted");
    }
}

int CurveEvaluator::evaluate(double temp) const {
    return evaluateCurve(temp, segments_, bounds_);
}

} // namespace ipmicurve
