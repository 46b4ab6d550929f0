#pragma once

#include "Collaborators.hpp"
#include "ProcessUtils.hpp"
#include <string>
#include <vector>

namespace ipmicurve {

struct IpmiSession {
    std::string host; // empty = in-band through the local BMC driver
    std::string user;
    std::string pass;
};

// "0x26" style byte for raw IPMI commands.
std::string formatRawByte(unsigned int value);

class IpmiController {
public:
    explicit IpmiController(const IpmiSession& session);
    virtual ~IpmiController() = default;

    bool isRemote() const { return !session_.host.empty(); }

    // Detect if FreeIPMI is available
    bool detectFreeIPMI();

    // IBM System x IMM OEM fan commands, banks are 1-based
    bool setFanDuty(unsigned int bank, int duty);
    bool releaseFanBank(unsigned int bank);
    bool restoreAutomaticFanControl(unsigned int banks);

    // ipmi-sensors CSV dump, see parseIpmiSensorsCsv()
    ProcessResult querySensors();

    // Full argument vector for a FreeIPMI tool, session flags included
    std::vector<std::string> buildCommand(const std::string& tool, const std::vector<std::string>& extraArgs) const;

protected:
    // Execute raw IPMI command (using FreeIPMI's ipmi-raw)
    virtual bool executeRaw(const std::vector<std::string>& rawArgs);

private:
    IpmiSession session_;
};

class IpmiFanActuator : public Actuator {
public:
    explicit IpmiFanActuator(IpmiController& ipmi) : ipmi_(ipmi) {}

    bool setDutyCycle(unsigned int bank, int duty) override;

private:
    IpmiController& ipmi_;
};

} // namespace ipmicurve
