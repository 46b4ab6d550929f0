#include "Telemetry.hpp"
#include "IpmiController.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>
#include <unistd.h>

namespace ipmicurve {

namespace {

std::string escapeTag(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == ',' || c == '=' || c == ' ') out += '\\';
        out += c;
    }
    return out;
}

} // namespace

std::string formatLineProtocol(const std::string& measurement, const std::string& host, int duty) {
    std::ostringstream oss;
    oss << escapeTag(measurement) << ",host=" << escapeTag(host)
        << " duty_percent=" << duty << "i"
        << ",duty_raw=\"" << formatRawByte(static_cast<unsigned int>(duty)) << "\"";
    return oss.str();
}

std::string localHostname() {
    char name[256] = {0};
    if (gethostname(name, sizeof(name) - 1) != 0 || name[0] == '\0') {
        return "localhost";
    }
    return std::string(name);
}

LineProtocolFileEmitter::LineProtocolFileEmitter(std::string path, std::string measurement, std::string host)
    : path_(std::move(path)), measurement_(std::move(measurement)), host_(std::move(host)) {}

bool LineProtocolFileEmitter::publish(int duty) {
    const std::string tmpPath = path_ + ".tmp";

    {
        std::ofstream out(tmpPath, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            std::cerr << "[Telemetry] Failed to open " << tmpPath << std::endl;
            return false;
        }
        out << formatLineProtocol(measurement_, host_, duty) << "\n";
        out.flush();
        if (!out) {
            std::cerr << "[Telemetry] Failed to write " << tmpPath << std::endl;
            return false;
        }
    }

    if (std::rename(tmpPath.c_str(), path_.c_str()) != 0) {
        std::cerr << "[Telemetry] Failed to replace " << path_ << std::endl;
        std::remove(tmpPath.c_str());
        return false;
    }
    return true;
}

} // namespace ipmicurve
