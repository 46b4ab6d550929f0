#pragma once

namespace ipmicurve {

// Supplies one aggregated temperature (Celsius) per call.
class TemperatureSource {
public:
    virtual ~TemperatureSource() = default;

    // Returns false when no usable reading could be produced.
    virtual bool sample(double& celsius) = 0;
};

// Fan command sink, one call per bank per actuation.
class Actuator {
public:
    virtual ~Actuator() = default;

    virtual bool setDutyCycle(unsigned int bank, int duty) = 0;
};

class TelemetryEmitter {
public:
    virtual ~TelemetryEmitter() = default;

    virtual bool publish(int duty) = 0;
};

class NullTelemetryEmitter : public TelemetryEmitter {
public:
    bool publish(int) override { return true; }
};

} // namespace ipmicurve
