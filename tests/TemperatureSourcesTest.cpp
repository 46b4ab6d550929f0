#include "TemperatureSources.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace ipmicurve {
namespace {

const char kSensorsOutput[] =
    "coretemp-isa-0000\n"
    "Adapter: ISA adapter\n"
    "Package id 0:\n"
    "  temp1_input: 48.000\n"
    "  temp1_max: 80.000\n"
    "  temp1_crit: 100.000\n"
    "Core 0:\n"
    "  temp2_input: 45.000\n"
    "Core 1:\n"
    "  temp3_input: 51.500\n"
    "\n"
    "coretemp-isa-0001\n"
    "Adapter: ISA adapter\n"
    "Package id 1:\n"
    "  temp1_input: 55.000\n"
    "\n"
    "acpitz-acpi-0\n"
    "Adapter: ACPI interface\n"
    "temp1:\n"
    "  temp1_input: nan\n"
    "\n"
    "power_meter-acpi-0\n"
    "Adapter: ACPI interface\n"
    "power1:\n"
    "  power1_average: 180.000\n";

const char kIpmiCsv[] =
    "1,Inlet Temp,Temperature,Nominal,22.00,C,'OK'\n"
    "2,Exhaust Temp,Temperature,Nominal,38.00,C,'OK'\n"
    "3,Temp,Temperature,Nominal,61.00,C,'OK'\n"
    "4,Temp,Temperature,Nominal,N/A,C,N/A\n"
    "5,Fan1,Fan,Nominal,3600.00,RPM,'OK'\n"
    "garbage line\n";

TEST(ParseSensorsOutputTest, ReadsEveryTemperatureInput) {
    auto readings = parseSensorsOutput(kSensorsOutput);

    ASSERT_EQ(readings.size(), 4u);
    EXPECT_EQ(readings[0].chip, "coretemp-isa-0000");
    EXPECT_EQ(readings[0].channel, "Package id 0");
    EXPECT_DOUBLE_EQ(readings[0].celsius, 48.0);
    EXPECT_EQ(readings[2].channel, "Core 1");
    EXPECT_DOUBLE_EQ(readings[2].celsius, 51.5);
    EXPECT_EQ(readings[3].chip, "coretemp-isa-0001");
    EXPECT_DOUBLE_EQ(readings[3].celsius, 55.0);
}

TEST(ParseSensorsOutputTest, EmptyOrNoiseYieldsNothing) {
    EXPECT_TRUE(parseSensorsOutput("").empty());
    EXPECT_TRUE(parseSensorsOutput("ERROR: Can't get value\n  temp1_input: 40\n").empty());
}

TEST(ParseIpmiSensorsCsvTest, KeepsNumericTemperatureRows) {
    auto readings = parseIpmiSensorsCsv(kIpmiCsv);

    ASSERT_EQ(readings.size(), 3u);
    EXPECT_EQ(readings[0].channel, "Inlet Temp");
    EXPECT_DOUBLE_EQ(readings[2].celsius, 61.0);
}

TEST(AggregateMaximumTest, TakesHottestReading) {
    double temp = 0.0;
    ASSERT_TRUE(aggregateMaximum(parseSensorsOutput(kSensorsOutput), {}, temp));
    EXPECT_DOUBLE_EQ(temp, 55.0);
}

TEST(AggregateMaximumTest, FiltersByChannel) {
    double temp = 0.0;
    ASSERT_TRUE(aggregateMaximum(parseSensorsOutput(kSensorsOutput), {"Core 0", "Core 1"}, temp));
    EXPECT_DOUBLE_EQ(temp, 51.5);
}

TEST(AggregateMaximumTest, RejectsImplausibleReadings) {
    std::vector<SensorReading> readings = {
        {"chip", "a", 255.0},
        {"chip", "b", -128.0},
        {"chip", "c", 47.0},
    };
    double temp = 0.0;
    ASSERT_TRUE(aggregateMaximum(readings, {}, temp));
    EXPECT_DOUBLE_EQ(temp, 47.0);
}

TEST(AggregateMaximumTest, FailsWithoutUsableReading) {
    double temp = -1.0;
    EXPECT_FALSE(aggregateMaximum({}, {}, temp));
    EXPECT_FALSE(aggregateMaximum(parseSensorsOutput(kSensorsOutput), {"Core 7"}, temp));
    EXPECT_DOUBLE_EQ(temp, -1.0);
}

} // namespace
} // namespace ipmicurve
