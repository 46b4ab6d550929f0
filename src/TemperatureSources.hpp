#pragma once

#include "Collaborators.hpp"
#include <string>
#include <vector>

namespace ipmicurve {

class IpmiController;

struct SensorReading {
    std::string chip;
    std::string channel;
    double celsius;
};

// Parses `sensors -u` output into one reading per tempN_input line.
std::vector<SensorReading> parseSensorsOutput(const std::string& text);

// Parses `ipmi-sensors --comma-separated-output --no-header-output` rows of type Temperature.
std::vector<SensorReading> parseIpmiSensorsCsv(const std::string& text);

/**
 * Maximum over the readings whose channel is listed in channels (every
 * reading when channels is empty). Implausible values are skipped.
 * @return false if no usable reading remains.
 */
bool aggregateMaximum(const std::vector<SensorReading>& readings,
                      const std::vector<std::string>& channels, double& out);

class LmSensorsSource : public TemperatureSource {
public:
    explicit LmSensorsSource(std::vector<std::string> channels);

    bool sample(double& celsius) override;

private:
    std::vector<std::string> channels_;
};

class IpmiSensorSource : public TemperatureSource {
public:
    IpmiSensorSource(IpmiController& ipmi, std::vector<std::string> channels);

    bool sample(double& celsius) override;

private:
    IpmiController& ipmi_;
    std::vector<std::string> channels_;
};

} // namespace ipmicurve
