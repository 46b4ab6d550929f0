#pragma once

#include "Common.hpp"
#include <string>
#include <vector>

namespace ipmicurve {

/**
 * Parses whitespace separated "temp:duty" tokens, e.g. "40:25 55:50".
 * Points are returned in input order.
 * @throws ConfigurationError on a malformed token.
 */
std::vector<ControlPoint> parseSetpoints(const std::string& setpointString);

/**
 * Compiles control points into segments ordered by increasing upper bound.
 * Each segment is the exact line through two adjacent points. A single
 * point compiles to one flat segment at that point's duty cycle.
 * @throws ConfigurationError if points is empty or temperatures repeat.
 */
std::vector<Segment> compileCurve(std::vector<ControlPoint> points);

} // namespace ipmicurve
