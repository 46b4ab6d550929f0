#include "TemperatureSources.hpp"
#include "Common.hpp"
#include "IpmiController.hpp"
#include "ProcessUtils.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <utility>

namespace ipmicurve {

namespace {

bool parseReading(const std::string& text, double& out) {
    std::string trimmed = text;
    trimmed.erase(0, trimmed.find_first_not_of(" \t"));
    trimmed.erase(trimmed.find_last_not_of(" \t\r") + 1);
    if (trimmed.empty()) return false;

    char* end = nullptr;
    double value = std::strtod(trimmed.c_str(), &end);
    if (end != trimmed.c_str() + trimmed.size() || !std::isfinite(value)) {
        return false;
    }
    out = value;
    return true;
}

bool isTempInputKey(const std::string& key) {
    const std::string prefix = "temp";
    const std::string suffix = "_input";
    return key.size() > prefix.size() + suffix.size() &&
           key.compare(0, prefix.size(), prefix) == 0 &&
           key.compare(key.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::vector<SensorReading> parseSensorsOutput(const std::string& text) {
    std::vector<SensorReading> readings;
    std::istringstream stream(text);
    std::string line;
    std::string chip;
    std::string channel;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) {
            chip.clear();
            channel.clear();
            continue;
        }

        bool indented = (line[0] == ' ' || line[0] == '\t');
        auto colonPos = line.find(':');

        if (!indented) {
            if (colonPos == std::string::npos) {
                chip = line;
                channel.clear();
            } else if (colonPos == line.size() - 1) {
                channel = line.substr(0, colonPos);
            }
            // "Adapter: ..." and similar key/value headers are skipped
            continue;
        }

        if (colonPos == std::string::npos || channel.empty()) continue;

        std::string key = line.substr(0, colonPos);
        key.erase(0, key.find_first_not_of(" \t"));
        if (!isTempInputKey(key)) continue;

        double value = 0.0;
        if (parseReading(line.substr(colonPos + 1), value)) {
            readings.push_back({chip, channel, value});
        }
    }

    return readings;
}

std::vector<SensorReading> parseIpmiSensorsCsv(const std::string& text) {
    std::vector<SensorReading> readings;
    std::istringstream stream(text);
    std::string line;

    while (std::getline(stream, line)) {
        if (line.empty()) continue;

        std::vector<std::string> fields;
        std::stringstream ss(line);
        std::string field;

        while (std::getline(ss, field, ',')) {
            if (field.length() >= 2 && field.front() == '\'' && field.back() == '\'') {
                field = field.substr(1, field.length() - 2);
            }
            fields.push_back(std::move(field));
        }

        // Need at least: ID, Name, Type, State, Reading, Units
        if (fields.size() < 6) continue;
        if (fields[2] != "Temperature") continue;

        double value = 0.0;
        if (parseReading(fields[4], value)) {
            readings.push_back({"ipmi", fields[1], value});
        }
    }

    return readings;
}

bool aggregateMaximum(const std::vector<SensorReading>& readings,
                      const std::vector<std::string>& channels, double& out) {
    bool found = false;
    double maxTemp = 0.0;

    for (const auto& r : readings) {
        if (!channels.empty() &&
            std::find(channels.begin(), channels.end(), r.channel) == channels.end()) {
            continue;
        }
        if (r.celsius < MIN_PLAUSIBLE_TEMP || r.celsius > MAX_PLAUSIBLE_TEMP) {
            if (std::getenv("VERBOSE")) {
                std::cerr << "[Sensors] Ignoring implausible reading " << r.celsius
                          << "C from " << r.chip << "/" << r.channel << std::endl;
            }
            continue;
        }
        if (!found || r.celsius > maxTemp) {
            maxTemp = r.celsius;
            found = true;
        }
    }

    if (found) out = maxTemp;
    return found;
}

LmSensorsSource::LmSensorsSource(std::vector<std::string> channels)
    : channels_(std::move(channels)) {}

bool LmSensorsSource::sample(double& celsius) {
    ProcessResult result = executeSafe({"sensors", "-u"}, 10);
    if (!result.ok()) {
        std::cerr << "[Sensors] sensors -u failed: " << describeFailure(result) << std::endl;
        return false;
    }

    return aggregateMaximum(parseSensorsOutput(result.stdOut), channels_, celsius);
}

IpmiSensorSource::IpmiSensorSource(IpmiController& ipmi, std::vector<std::string> channels)
    : ipmi_(ipmi), channels_(std::move(channels)) {}

bool IpmiSensorSource::sample(double& celsius) {
    ProcessResult result = ipmi_.querySensors();
    if (!result.ok()) {
        std::cerr << "[Sensors] ipmi-sensors failed: " << describeFailure(result) << std::endl;
        return false;
    }

    return aggregateMaximum(parseIpmiSensorsCsv(result.stdOut), channels_, celsius);
}

} // namespace ipmicurve
