#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace ipmicurve {

// Temperatures are standardized on Celsius

struct ControlPoint {
    double temp;
    double duty;

    bool operator<(const ControlPoint& other) const {
        return temp < other.temp;
    }
};

// duty = slope * temp + intercept, valid up to and including upperBound
struct Segment {
    double upperBound;
    double slope;
    double intercept;
};

struct DutyBounds {
    int min = 0;
    int max = 100;
};

enum class FaultKind {
    Configuration,
    Sampling,
    Actuation,
    Telemetry
};

const char* faultKindName(FaultKind kind);

class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

static constexpr double MIN_PLAUSIBLE_TEMP = -40.0;
static constexpr double MAX_PLAUSIBLE_TEMP = 150.0;
static constexpr int MAX_RAW_DUTY = 0x64; // IMM fan duty is a percentage

} // namespace ipmicurve
