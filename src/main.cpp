#include <iostream>
#include <iomanip>
#include <csignal>
#include <memory>
#include <string>
#include <unistd.h>

#include "Config.hpp"
#include "ControlLoop.hpp"
#include "CurveCompiler.hpp"
#include "CurveEvaluator.hpp"
#include "IpmiController.hpp"
#include "Telemetry.hpp"
#include "TemperatureSources.hpp"

using namespace ipmicurve;

// Global state for signal handling
static volatile std::sig_atomic_t g_running = 1;

void signalHandler(int signum) {
    g_running = 0;
    if (signum == SIGSEGV || signum == SIGBUS) _exit(128 + signum);
}

static std::string joinArgs(int argc, char* argv[], int first) {
    std::string joined;
    for (int i = first; i < argc; ++i) {
        joined += argv[i];
        joined += " ";
    }
    return joined;
}

static void printCurve(const CurveEvaluator& curve) {
    std::cout << "Segments:" << std::endl;
    for (const auto& s : curve.getSegments()) {
        std::cout << "  <= " << std::setw(6) << s.upperBound << "C  duty = "
                  << s.slope << " * T + " << s.intercept << std::endl;
    }

    std::cout << "Duty cycle (clamped to " << curve.getBounds().min << ".." << curve.getBounds().max << "):" << std::endl;
    for (int t = 20; t <= 100; t += 5) {
        int duty = curve.evaluate(t);
        std::cout << "  " << std::setw(3) << t << "C -> " << std::setw(3) << duty
                  << " (" << formatRawByte(static_cast<unsigned int>(duty)) << ")" << std::endl;
    }
}

static int runController(const Config& cfg, const CurveEvaluator& curve) {
    IpmiController ipmi(cfg.ipmi);
    if (!ipmi.detectFreeIPMI()) {
        std::cerr << "[IPMI] Continuing; fan commands will fail until FreeIPMI is installed" << std::endl;
    }

    std::unique_ptr<TemperatureSource> source;
    if (cfg.source == SourceKind::Ipmi) {
        source = std::make_unique<IpmiSensorSource>(ipmi, cfg.channels);
    } else {
        source = std::make_unique<LmSensorsSource>(cfg.channels);
    }

    std::unique_ptr<TelemetryEmitter> telemetry;
    if (!cfg.telemetryFile.empty()) {
        telemetry = std::make_unique<LineProtocolFileEmitter>(cfg.telemetryFile, cfg.telemetryMeasurement, localHostname());
        std::cout << "[Telemetry] Writing line protocol to " << cfg.telemetryFile << std::endl;
    } else {
        telemetry = std::make_unique<NullTelemetryEmitter>();
    }

    IpmiFanActuator actuator(ipmi);
    ControlLoop loop(curve, cfg.loop, *source, actuator, *telemetry);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::cout << "Starting fan curve control for " << cfg.loop.fanBanks << " bank(s), "
              << cfg.setpoints.size() << " setpoint(s), polling every "
              << cfg.loop.pollInterval.count() << "ms" << std::endl;

    loop.run(g_running);

    std::cout << "Stopping after " << loop.getTickCount() << " tick(s)" << std::endl;
    if (!ipmi.restoreAutomaticFanControl(cfg.loop.fanBanks)) {
        std::cerr << "[IPMI] Failed to hand fan control back to the BMC" << std::endl;
        return 1;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    try {
        if (argc < 2) {
            std::cerr << "Usage: ipmicurve <run|curve> [TEMP:DUTY ...]" << std::endl;
            return 1;
        }

        std::string command = argv[1];
        if (command != "run" && command != "curve") {
            std::cerr << "Unknown command '" << command << "' (try run or curve)" << std::endl;
            return 1;
        }

        Config cfg = loadConfig(joinArgs(argc, argv, 2));
        CurveEvaluator curve(compileCurve(cfg.setpoints), cfg.bounds);

        if (command == "curve") {
            printCurve(curve);
            return 0;
        }

        return runController(cfg, curve);

    } catch (const ConfigurationError& e) {
        std::cerr << "[Config] " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 1;
    }
}
