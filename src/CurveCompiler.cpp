#include "CurveCompiler.hpp"
#include <sstream>
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace ipmicurve {

namespace {

bool parseNumber(const std::string& text, double& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(value)) {
        return false;
    }
    out = value;
    return true;
}

} // namespace

std::vector<ControlPoint> parseSetpoints(const std::string& setpointString) {
    std::vector<ControlPoint> points;
    std::stringstream ss(setpointString);
    std::string token;

    while (ss >> token) {
        auto colonPos = token.find(':');
        ControlPoint point{0.0, 0.0};
        if (colonPos == std::string::npos ||
            !parseNumber(token.substr(0, colonPos), point.temp) ||
            !parseNumber(token.substr(colonPos + 1), point.duty)) {
            throw ConfigurationError("Invalid setpoint '" + token + "' (expected TEMP:DUTY)");
        }
        points.push_back(point);
    }

    return points;
}

std::vector<Segment> compileCurve(std::vector<ControlPoint> points) {
    if (points.empty()) {
        throw ConfigurationError("Fan curve needs at least one setpoint");
    }

    std::sort(points.begin(), points.end());

    for (size_t i = 1; i < points.size(); ++i) {
        if (points[i].temp == points[i - 1].temp) {
            std::ostringstream msg;
            msg << "Duplicate setpoint temperature " << points[i].temp;
            throw ConfigurationError(msg.str());
        }
    }

    std::vector<Segment> segments;

    if (points.size() == 1) {
        // Degenerate curve: constant output everywhere
        segments.push_back({points.front().temp, 0.0, points.front().duty});
        return segments;
    }

    segments.reserve(points.size() - 1);
    for (size_t i = 0; i + 1 < points.size(); ++i) {
        const ControlPoint& lo = points[i];
        const ControlPoint& hi = points[i + 1];

        double slope = (hi.duty - lo.duty) / (hi.temp - lo.temp);
        double intercept = hi.duty - slope * hi.temp;
        segments.push_back({hi.temp, slope, intercept});
    }

    return segments;
}

} // namespace ipmicurve
