#include "Common.hpp"

namespace ipmicurve {

const char* faultKindName(FaultKind kind) {
    switch (kind) {
        case FaultKind::Configuration: return "configuration";
        case FaultKind::Sampling: return "sampling";
        case FaultKind::Actuation: return "actuation";
        case FaultKind::Telemetry: return "telemetry";
    }
    return "unknown";
}

} // namespace ipmicurve
