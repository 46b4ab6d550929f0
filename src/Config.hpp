#pragma once

#include "Common.hpp"
#include "ControlLoop.hpp"
#include "IpmiController.hpp"
#include <string>
#include <vector>

namespace ipmicurve {

enum class SourceKind {
    LmSensors,
    Ipmi
};

struct Config {
    std::vector<ControlPoint> setpoints;
    DutyBounds bounds;
    LoopSettings loop;

    SourceKind source = SourceKind::LmSensors;
    std::vector<std::string> channels;

    IpmiSession ipmi;

    std::string telemetryFile;
    std::string telemetryMeasurement = "ipmi_fan";

    bool verbose = false;
};

/**
 * Builds the process configuration from the setpoint arguments (falls back
 * to FAN_SETPOINTS when empty) and the environment.
 * @throws ConfigurationError on any missing or invalid value.
 */
Config loadConfig(const std::string& setpointArgs);

} // namespace ipmicurve
