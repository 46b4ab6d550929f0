#include "IpmiController.hpp"
#include "Common.hpp"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <cstdlib>

namespace ipmicurve {

namespace {

constexpr int RAW_TIMEOUT_SEC = 10;
constexpr int SENSORS_TIMEOUT_SEC = 25;

} // namespace

std::string formatRawByte(unsigned int value) {
    std::ostringstream ss;
    ss << "0x" << std::hex << std::setw(2) << std::setfill('0') << (value & 0xffu);
    return ss.str();
}

IpmiController::IpmiController(const IpmiSession& session) : session_(session) {
    if (isRemote()) {
        std::cout << "[IPMI] Controller initialized for host: " << session_.host << std::endl;
    } else {
        std::cout << "[IPMI] Controller initialized for the local BMC (in-band)" << std::endl;
    }
}

std::vector<std::string> IpmiController::buildCommand(const std::string& tool,
                                                      const std::vector<std::string>& extraArgs) const {
    std::vector<std::string> args = { tool };

    if (isRemote()) {
        args.insert(args.end(), {
            "-h", session_.host,
            "-u", session_.user,
            "-p", session_.pass,
            "--driver-type=LAN_2_0",
            "-l", "OPERATOR",
            "--workaround-flags=authcap,idzero,unexpectedauth,forcepermsg",
            "--session-timeout=20000",
            "--retransmission-timeout=2000"
        });
    }

    args.insert(args.end(), extraArgs.begin(), extraArgs.end());
    return args;
}

bool IpmiController::detectFreeIPMI() {
    ProcessResult result = executeSafe({"ipmi-raw", "--version"}, 3);
    if (!result.ok()) {
        std::cerr << "[IPMI] FreeIPMI not usable (" << describeFailure(result) << ")" << std::endl;
        return false;
    }

    if (std::getenv("VERBOSE")) {
        std::string msg = result.stdOut.substr(0, result.stdOut.find('\n'));
        if (msg.length() > 50) {
            msg = msg.substr(0, 50) + "...";
        }
        std::cout << "[IPMI] FreeIPMI detected: " << msg << std::endl;
    }
    return true;
}

bool IpmiController::setFanDuty(unsigned int bank, int duty) {
    if (duty < 0 || duty > MAX_RAW_DUTY || bank < 1 || bank > 0xffu) {
        std::cerr << "[IPMI] Refusing out of range fan command (bank " << bank
                  << ", duty " << duty << ")" << std::endl;
        return false;
    }

    // Trailing 0x01 keeps the override active until released
    bool ok = executeRaw({"0x3a", "0x07", formatRawByte(bank),
                          formatRawByte(static_cast<unsigned int>(duty)), "0x01"});

    if (ok && std::getenv("VERBOSE")) {
        std::cout << "[IPMI] Set fan bank " << bank << " to " << duty << "%" << std::endl;
    }
    return ok;
}

bool IpmiController::releaseFanBank(unsigned int bank) {
    if (bank < 1 || bank > 0xffu) {
        std::cerr << "[IPMI] Refusing to release invalid fan bank " << bank << std::endl;
        return false;
    }
    return executeRaw({"0x3a", "0x07", formatRawByte(bank), "0x00", "0x00"});
}

bool IpmiController::restoreAutomaticFanControl(unsigned int banks) {
    unsigned int failed = 0;
    for (unsigned int bank = 1; bank <= banks; ++bank) {
        if (!releaseFanBank(bank)) failed++;
    }

    if (failed == 0) {
        std::cout << "[IPMI] Restored automatic fan control on " << banks << " bank(s)" << std::endl;
    }
    return failed == 0;
}

ProcessResult IpmiController::querySensors() {
    return executeSafe(buildCommand("ipmi-sensors", {
        "--sdr-cache-recreate",
        "--comma-separated-output",
        "--output-sensor-state",
        "--no-header-output",
        "--quiet-cache",
        "--ignore-not-available-sensors",
        "--ignore-unrecognized-events",
        "--sensor-types=Temperature"
    }), SENSORS_TIMEOUT_SEC);
}

bool IpmiController::executeRaw(const std::vector<std::string>& rawArgs) {
    ProcessResult result = executeSafe(buildCommand("ipmi-raw", rawArgs), RAW_TIMEOUT_SEC);

    if (!result.ok()) {
        std::cerr << "[IPMI] Raw command failed: " << describeFailure(result) << std::endl;
        return false;
    }
    return true;
}

bool IpmiFanActuator::setDutyCycle(unsigned int bank, int duty) {
    return ipmi_.setFanDuty(bank, duty);
}

} // namespace ipmicurve
