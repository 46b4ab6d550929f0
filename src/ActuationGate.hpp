#pragma once

namespace ipmicurve {

struct ControllerState {
    double lastActuatedTemp = 0.0;
    int lastActuatedDuty = 0;
    int currentDuty = 0;
    bool failsafeActive = false;
};

/**
 * Debounce on temperature drift since the last actuation. Returns true only
 * when |newTemp - lastActuatedTemp| exceeds threshold; newDuty does not take
 * part in the decision.
 */
bool shouldActuate(double newTemp, int newDuty, const ControllerState& state, double threshold);

} // namespace ipmicurve
