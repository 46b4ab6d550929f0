#include "ControlLoop.hpp"
#include <iostream>
#include <cmath>
#include <cstdlib>
#include <thread>
#include <string>

namespace ipmicurve {

ControlLoop::ControlLoop(const CurveEvaluator& curve, const LoopSettings& settings,
                         TemperatureSource& source, Actuator& actuator, TelemetryEmitter& telemetry)
    : curve_(curve), settings_(settings), source_(source), actuator_(actuator),
      telemetry_(telemetry), verbose_(std::getenv("VERBOSE") != nullptr) {}

unsigned long ControlLoop::getFaultCount(FaultKind kind) const {
    return faultCounts_[static_cast<size_t>(kind)];
}

void ControlLoop::reportFault(FaultKind kind, const std::string& detail) {
    faultCounts_[static_cast<size_t>(kind)]++;
    std::cerr << "[Loop] " << faultKindName(kind) << " error: " << detail << std::endl;
}

bool ControlLoop::sampleTemperature(double& temp) {
    double reading = 0.0;
    bool ok = false;
    try {
        ok = source_.sample(reading);
    } catch (const std::exception& e) {
        reportFault(FaultKind::Sampling, std::string("temperature source threw: ") + e.what());
        return false;
    }

    if (!ok) {
        reportFault(FaultKind::Sampling, "no usable temperature reading");
        return false;
    }
    if (!std::isfinite(reading) || reading < MIN_PLAUSIBLE_TEMP || reading > MAX_PLAUSIBLE_TEMP) {
        reportFault(FaultKind::Sampling, "implausible temperature " + std::to_string(reading));
        return false;
    }

    temp = reading;
    return true;
}

void ControlLoop::publishTelemetry(int duty) {
    try {
        if (!telemetry_.publish(duty)) {
            reportFault(FaultKind::Telemetry, "failed to publish duty " + std::to_string(duty));
        }
    } catch (const std::exception& e) {
        reportFault(FaultKind::Telemetry, std::string("telemetry emitter threw: ") + e.what());
    }
}

unsigned int ControlLoop::actuateAllBanks(int duty) {
    unsigned int failed = 0;
    for (unsigned int bank = 1; bank <= settings_.fanBanks; ++bank) {
        bool ok = false;
        try {
            ok = actuator_.setDutyCycle(bank, duty);
        } catch (const std::exception& e) {
            reportFault(FaultKind::Actuation, "bank " + std::to_string(bank) + " threw: " + e.what());
            failed++;
            continue;
        }
        if (!ok) {
            reportFault(FaultKind::Actuation, "bank " + std::to_string(bank) + " rejected duty " + std::to_string(duty));
            failed++;
        }
    }
    return failed;
}

void ControlLoop::enterFailsafe() {
    int duty = curve_.getBounds().max;
    std::cerr << "[Loop] " << consecutiveSampleFailures_
              << " consecutive sampling failures, driving fans to " << duty << std::endl;

    state_.currentDuty = duty;
    haveDuty_ = true;
    if (actuateAllBanks(duty) == 0) {
        state_.lastActuatedDuty = duty;
        state_.failsafeActive = true;
    }
}

void ControlLoop::tick() {
    loopState_ = LoopState::Updating;
    tickCount_++;

    double temp = 0.0;
    if (!sampleTemperature(temp)) {
        consecutiveSampleFailures_++;
        if (settings_.failsafeAfter > 0 && consecutiveSampleFailures_ >= settings_.failsafeAfter &&
            !state_.failsafeActive) {
            enterFailsafe();
        }
        // Keep monitoring alive with the last known desired duty
        if (haveDuty_) {
            publishTelemetry(state_.currentDuty);
        }
        loopState_ = LoopState::Idle;
        return;
    }
    consecutiveSampleFailures_ = 0;

    int duty = curve_.evaluate(temp);
    state_.currentDuty = duty;
    haveDuty_ = true;

    publishTelemetry(duty);

    bool actuate = state_.failsafeActive ||
                   shouldActuate(temp, duty, state_, settings_.debounceThreshold);
    if (actuate) {
        // Partial failure keeps the old state so the next tick retries
        if (actuateAllBanks(duty) == 0) {
            state_.lastActuatedTemp = temp;
            state_.lastActuatedDuty = duty;
            state_.failsafeActive = false;
        }
    }

    if (verbose_) {
        std::cout << "[Loop] Temp: " << temp << "C \tFan: " << duty
                  << (actuate ? "" : " (held " + std::to_string(state_.lastActuatedDuty) + ")")
                  << std::endl;
    }

    loopState_ = LoopState::Idle;
}

void ControlLoop::run(const volatile std::sig_atomic_t& running) {
    const auto slice = std::chrono::milliseconds(100);

    while (running) {
        tick();

        auto deadline = std::chrono::steady_clock::now() + settings_.pollInterval;
        while (running && std::chrono::steady_clock::now() < deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            std::this_thread::sleep_for(remaining < slice ? remaining : slice);
        }
    }
}

} // namespace ipmicurve
