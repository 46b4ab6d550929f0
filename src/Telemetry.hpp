#pragma once

#include "Collaborators.hpp"
#include <string>

namespace ipmicurve {

/**
 * One InfluxDB line protocol record, e.g.
 *   ipmi_fan,host=srv1 duty_percent=38i,duty_raw="0x26"
 */
std::string formatLineProtocol(const std::string& measurement, const std::string& host, int duty);

std::string localHostname();

// Rewrites path with the latest record on every publish (tmp file + rename).
class LineProtocolFileEmitter : public TelemetryEmitter {
public:
    LineProtocolFileEmitter(std::string path, std::string measurement, std::string host);

    bool publish(int duty) override;

    const std::string& getPath() const { return path_; }

private:
    std::string path_;
    std::string measurement_;
    std::string host_;
};

} // namespace ipmicurve
