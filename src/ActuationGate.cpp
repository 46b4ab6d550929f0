#include "ActuationGate.hpp"
#include <cmath>

namespace ipmicurve {

bool shouldActuate(double newTemp, int /*newDuty*/, const ControllerState& state, double threshold) {
    return std::fabs(newTemp - state.lastActuatedTemp) > threshold;
}

} // namespace ipmicurve
