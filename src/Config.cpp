#include "Config.hpp"
#include "CurveCompiler.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace ipmicurve {

namespace {

constexpr double MAX_POLL_INTERVAL_SEC = 86400.0;

std::string envOr(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

long envLong(const char* name, long fallback, long minValue, long maxValue) {
    const char* value = std::getenv(name);
    if (!value || *value == '\0') return fallback;

    char* end = nullptr;
    errno = 0;
    long parsed = std::strtol(value, &end, 10);
    if (errno != 0 || *end != '\0' || parsed < minValue || parsed > maxValue) {
        std::ostringstream msg;
        msg << name << "='" << value << "' must be an integer in [" << minValue << ", " << maxValue << "]";
        throw ConfigurationError(msg.str());
    }
    return parsed;
}

double envDouble(const char* name, double fallback, double minValue, double maxValue) {
    const char* value = std::getenv(name);
    if (!value || *value == '\0') return fallback;

    char* end = nullptr;
    double parsed = std::strtod(value, &end);
    if (*end != '\0' || !std::isfinite(parsed) || parsed < minValue || parsed > maxValue) {
        std::ostringstream msg;
        msg << name << "='" << value << "' must be a number in [" << minValue << ", " << maxValue << "]";
        throw ConfigurationError(msg.str());
    }
    return parsed;
}

std::vector<std::string> splitList(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

} // namespace

Config loadConfig(const std::string& setpointArgs) {
    Config cfg;

    std::string setpoints = setpointArgs;
    if (setpoints.find_first_not_of(" \t") == std::string::npos) {
        setpoints = envOr("FAN_SETPOINTS", "");
    }
    cfg.setpoints = parseSetpoints(setpoints);
    if (cfg.setpoints.empty()) {
        throw ConfigurationError("No fan setpoints given (pass TEMP:DUTY arguments or set FAN_SETPOINTS)");
    }

    double interval = envDouble("POLL_INTERVAL", 10.0, 0.0, MAX_POLL_INTERVAL_SEC);
    if (interval <= 0.0) {
        throw ConfigurationError("POLL_INTERVAL must be greater than zero");
    }
    cfg.loop.pollInterval = std::chrono::milliseconds(static_cast<long long>(std::llround(interval * 1000.0)));
    if (cfg.loop.pollInterval.count() <= 0) {
        throw ConfigurationError("POLL_INTERVAL must be at least one millisecond");
    }

    cfg.loop.debounceThreshold = envDouble("DEBOUNCE_THRESHOLD", 2.0, 0.0,
                                            MAX_PLAUSIBLE_TEMP - MIN_PLAUSIBLE_TEMP);
    cfg.loop.fanBanks = static_cast<unsigned int>(envLong("FAN_BANKS", 1, 1, 16));
    cfg.loop.failsafeAfter = static_cast<unsigned int>(envLong("FAILSAFE_AFTER", 3, 0, 1000));

    cfg.bounds.min = static_cast<int>(envLong("DUTY_MIN", 0, 0, MAX_RAW_DUTY));
    cfg.bounds.max = static_cast<int>(envLong("DUTY_MAX", 100, 0, MAX_RAW_DUTY));
    if (cfg.bounds.min > cfg.bounds.max) {
        throw ConfigurationError("DUTY_MIN must not exceed DUTY_MAX");
    }

    std::string source = envOr("TEMP_SOURCE", "sensors");
    if (source == "sensors") {
        cfg.source = SourceKind::LmSensors;
    } else if (source == "ipmi") {
        cfg.source = SourceKind::Ipmi;
    } else {
        throw ConfigurationError("TEMP_SOURCE must be 'sensors' or 'ipmi', got '" + source + "'");
    }
    cfg.channels = splitList(envOr("TEMP_CHANNELS", ""));

    cfg.ipmi.host = envOr("IDRAC_IP", "");
    cfg.ipmi.user = envOr("IDRAC_USER", "");
    cfg.ipmi.pass = envOr("IDRAC_PASS", "");
    if (!cfg.ipmi.host.empty() && (cfg.ipmi.user.empty() || cfg.ipmi.pass.empty())) {
        throw ConfigurationError("IDRAC_IP requires IDRAC_USER and IDRAC_PASS");
    }

    cfg.telemetryFile = envOr("TELEMETRY_FILE", "");
    cfg.telemetryMeasurement = envOr("TELEMETRY_MEASUREMENT", "ipmi_fan");
    if (cfg.telemetryMeasurement.empty()) {
        throw ConfigurationError("TELEMETRY_MEASUREMENT must not be empty");
    }

    cfg.verbose = (std::getenv("VERBOSE") != nullptr);
    return cfg;
}

} // namespace ipmicurve
