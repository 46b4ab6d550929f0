#include "Config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

namespace ipmicurve {
namespace {

const char* const kVariables[] = {
    "FAN_SETPOINTS", "POLL_INTERVAL", "DEBOUNCE_THRESHOLD", "FAN_BANKS",
    "DUTY_MIN", "DUTY_MAX", "FAILSAFE_AFTER", "TEMP_SOURCE", "TEMP_CHANNELS",
    "IDRAC_IP", "IDRAC_USER", "IDRAC_PASS", "TELEMETRY_FILE", "TELEMETRY_MEASUREMENT",
};

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clearEnv(); }
    void TearDown() override { clearEnv(); }

    static void clearEnv() {
        for (const char* name : kVariables) unsetenv(name);
    }
};

TEST_F(ConfigTest, DefaultsApplyWhenOnlySetpointsGiven) {
    Config cfg = loadConfig("40:25 55:50");

    ASSERT_EQ(cfg.setpoints.size(), 2u);
    EXPECT_EQ(cfg.loop.pollInterval.count(), 10000);
    EXPECT_DOUBLE_EQ(cfg.loop.debounceThreshold, 2.0);
    EXPECT_EQ(cfg.loop.fanBanks, 1u);
    EXPECT_EQ(cfg.loop.failsafeAfter, 3u);
    EXPECT_EQ(cfg.bounds.min, 0);
    EXPECT_EQ(cfg.bounds.max, 100);
    EXPECT_EQ(cfg.source, SourceKind::LmSensors);
    EXPECT_TRUE(cfg.channels.empty());
    EXPECT_TRUE(cfg.ipmi.host.empty());
    EXPECT_TRUE(cfg.telemetryFile.empty());
    EXPECT_EQ(cfg.telemetryMeasurement, "ipmi_fan");
}

TEST_F(ConfigTest, FallsBackToEnvironmentSetpoints) {
    setenv("FAN_SETPOINTS", "30:10 60:50 80:100", 1);
    Config cfg = loadConfig("  ");
    EXPECT_EQ(cfg.setpoints.size(), 3u);
}

TEST_F(ConfigTest, CommandLineSetpointsWin) {
    setenv("FAN_SETPOINTS", "30:10 60:50 80:100", 1);
    Config cfg = loadConfig("50:100");
    ASSERT_EQ(cfg.setpoints.size(), 1u);
    EXPECT_DOUBLE_EQ(cfg.setpoints[0].duty, 100.0);
}

TEST_F(ConfigTest, ReadsEnvironmentOverrides) {
    setenv("POLL_INTERVAL", "2.5", 1);
    setenv("DEBOUNCE_THRESHOLD", "0", 1);
    setenv("FAN_BANKS", "2", 1);
    setenv("DUTY_MIN", "10", 1);
    setenv("DUTY_MAX", "80", 1);
    setenv("TEMP_SOURCE", "ipmi", 1);
    setenv("TEMP_CHANNELS", "Package id 0, Core 1 ,", 1);
    setenv("IDRAC_IP", "10.0.0.5", 1);
    setenv("IDRAC_USER", "root", 1);
    setenv("IDRAC_PASS", "calvin", 1);
    setenv("TELEMETRY_FILE", "/run/ipmicurve.influx", 1);

    Config cfg = loadConfig("40:25 55:50");
    EXPECT_EQ(cfg.loop.pollInterval.count(), 2500);
    EXPECT_DOUBLE_EQ(cfg.loop.debounceThreshold, 0.0);
    EXPECT_EQ(cfg.loop.fanBanks, 2u);
    EXPECT_EQ(cfg.bounds.min, 10);
    EXPECT_EQ(cfg.bounds.max, 80);
    EXPECT_EQ(cfg.source, SourceKind::Ipmi);
    ASSERT_EQ(cfg.channels.size(), 2u);
    EXPECT_EQ(cfg.channels[0], "Package id 0");
    EXPECT_EQ(cfg.channels[1], "Core 1");
    EXPECT_EQ(cfg.ipmi.host, "10.0.0.5");
    EXPECT_EQ(cfg.telemetryFile, "/run/ipmicurve.influx");
}

TEST_F(ConfigTest, MissingSetpointsAreFatal) {
    EXPECT_THROW(loadConfig(""), ConfigurationError);
}

TEST_F(ConfigTest, RejectsInvalidValues) {
    struct Case { const char* name; const char* value; };
    const Case cases[] = {
        {"POLL_INTERVAL", "0"},
        {"POLL_INTERVAL", "fast"},
        {"POLL_INTERVAL", "1e300"},
        {"POLL_INTERVAL", "86401"},
        {"POLL_INTERVAL", "0.0001"},
        {"DEBOUNCE_THRESHOLD", "-1"},
        {"FAN_BANKS", "0"},
        {"FAN_BANKS", "2x"},
        {"DUTY_MAX", "300"},
        {"DUTY_MAX", "101"},
        {"TEMP_SOURCE", "nvml"},
        {"IDRAC_IP", "10.0.0.5"},
    };

    for (const auto& c : cases) {
        clearEnv();
        setenv(c.name, c.value, 1);
        EXPECT_THROW(loadConfig("40:25 55:50"), ConfigurationError) << c.name << "=" << c.value;
    }
}

TEST_F(ConfigTest, AcceptsLongestPollInterval) {
    setenv("POLL_INTERVAL", "86400", 1);
    Config cfg = loadConfig("40:25 55:50");
    EXPECT_EQ(cfg.loop.pollInterval.count(), 86400000);
}

TEST_F(ConfigTest, RejectsInvertedBounds) {
    setenv("DUTY_MIN", "60", 1);
    setenv("DUTY_MAX", "40", 1);
    EXPECT_THROW(loadConfig("40:25 55:50"), ConfigurationError);
}

} // namespace
} // namespace ipmicurve
