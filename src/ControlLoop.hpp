#pragma once

#include "ActuationGate.hpp"
#include "Collaborators.hpp"
#include "Common.hpp"
#include "CurveEvaluator.hpp"
#include <array>
#include <chrono>
#include <csignal>

namespace ipmicurve {

struct LoopSettings {
    std::chrono::milliseconds pollInterval{10000};
    double debounceThreshold = 2.0;
    unsigned int fanBanks = 1;      // banks 1..fanBanks
    unsigned int failsafeAfter = 3; // consecutive sampling failures, 0 = off
};

enum class LoopState {
    Idle,
    Updating
};

class ControlLoop {
public:
    ControlLoop(const CurveEvaluator& curve, const LoopSettings& settings,
                TemperatureSource& source, Actuator& actuator, TelemetryEmitter& telemetry);

    // One sample-evaluate-report-gate-actuate cycle.
    void tick();

    // Ticks every poll interval until running drops to zero.
    void run(const volatile std::sig_atomic_t& running);

    const ControllerState& getState() const { return state_; }
    LoopState getLoopState() const { return loopState_; }
    unsigned long getTickCount() const { return tickCount_; }
    unsigned long getFaultCount(FaultKind kind) const;

private:
    bool sampleTemperature(double& temp);
    void publishTelemetry(int duty);
    unsigned int actuateAllBanks(int duty);
    void enterFailsafe();
    void reportFault(FaultKind kind, const std::string& detail);

    const CurveEvaluator& curve_;
    LoopSettings settings_;
    TemperatureSource& source_;
    Actuator& actuator_;
    TelemetryEmitter& telemetry_;

    ControllerState state_;
    LoopState loopState_ = LoopState::Idle;
    unsigned long tickCount_ = 0;
    unsigned int consecutiveSampleFailures_ = 0;
    bool haveDuty_ = false;
    std::array<unsigned long, 4> faultCounts_{};
    bool verbose_;
};

} // namespace ipmicurve
