#include "config.hpp"
#include <cstdlib>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <unistd.h>

using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        std::stringstream ss;
        ss << "/tmp/bt_presence_config_" << getpid() << '_'
           << ::testing::UnitTest::GetInstance()->current_test_info()->name() << ".conf";
        path = ss.str();
    }

    void TearDown() override
    {
        unlink(path.c_str());
        unsetenv("SCAN_INTERVAL");
        unsetenv("EXCLUDE_MAC_PREFIXES");
    }

    void write(const std::string &content)
    {
        std::ofstream file(path);
        file << content;
    }

    std::string path;
};

}

TEST(Config, Defaults)
{
    Config config = parse_config({});

    EXPECT_EQ(seconds(10), config.scan_interval);
    EXPECT_EQ(seconds(30), config.presence_timeout);
    EXPECT_EQ(seconds(8), config.scan_timeout);
    EXPECT_TRUE(config.exclude_mac_prefixes.empty());
    EXPECT_EQ("./bt_presence.log", config.log_path);
    EXPECT_EQ(-100, config.min_rssi);
    EXPECT_EQ(seconds(30), config.weak_signal_timeout);
    EXPECT_EQ(-90, config.weak_signal_threshold);
    EXPECT_EQ(1u, config.confirm_scans);
    EXPECT_FALSE(config.log_observations);
    EXPECT_EQ("hci0", config.adapter);
    EXPECT_EQ(0u, config.web_port);
}

TEST(Config, ParseValues)
{
    Config config = parse_config({
        {"scan_interval", "1.5"},
        {"presence_timeout", "5"},
        {"exclude_mac_prefixes", "cc:dd, 11:22 ,,"},
        {"log_path", "/var/log/bt.log"},
        {"min_rssi_dBm", "-85"},
        {"weak_signal_timeout", "20"},
        {"confirm_scans", "2"},
        {"log_observations", "yes"},
        {"adapter", "hci1"},
        {"web_port", "8080"},
        {"simulation_seed", "42"},
        {"simulation_failure_rate", "0.25"},
    });

    EXPECT_EQ(milliseconds(1500), config.scan_interval);
    EXPECT_EQ(seconds(5), config.presence_timeout);
    EXPECT_EQ(milliseconds(1200), config.scan_timeout);
    ASSERT_EQ(2u, config.exclude_mac_prefixes.size());
    EXPECT_EQ("cc:dd", config.exclude_mac_prefixes[0]);
    EXPECT_EQ("11:22", config.exclude_mac_prefixes[1]);
    EXPECT_EQ("/var/log/bt.log", config.log_path);
    EXPECT_EQ(-85, config.min_rssi);
    EXPECT_EQ(seconds(20), config.weak_signal_timeout);
    EXPECT_EQ(2u, config.confirm_scans);
    EXPECT_TRUE(config.log_observations);
    EXPECT_EQ("hci1", config.adapter);
    EXPECT_EQ(8080u, config.web_port);
    EXPECT_EQ(42u, config.simulation_seed);
    EXPECT_DOUBLE_EQ(0.25, config.simulation_failure_rate);
}

TEST(Config, WeakSignalTimeoutFollowsPresenceTimeout)
{
    Config config = parse_config({{"presence_timeout", "12"}});

    EXPECT_EQ(seconds(12), config.weak_signal_timeout);
}

TEST(Config, RejectsInvalidValues)
{
    EXPECT_THROW(parse_config({{"scan_interval", "0"}}), ConfigError);
    EXPECT_THROW(parse_config({{"scan_interval", "-1"}}), ConfigError);
    EXPECT_THROW(parse_config({{"presence_timeout", "abc"}}), ConfigError);
    EXPECT_THROW(parse_config({{"presence_timeout", "5s"}}), ConfigError);
    EXPECT_THROW(parse_config({{"confirm_scans", "0"}}), ConfigError);
    EXPECT_THROW(parse_config({{"log_observations", "maybe"}}), ConfigError);
    EXPECT_THROW(parse_config({{"web_port", "70000"}}), ConfigError);
    EXPECT_THROW(parse_config({{"simulation_failure_rate", "1.5"}}), ConfigError);
    EXPECT_THROW(parse_config({{"log_path", ""}}), ConfigError);
}

TEST(Config, DurationsRoundedToMilliseconds)
{
    Config config = parse_config({{"presence_timeout", "0.0016"}, {"scan_timeout", "0.25"}});
    EXPECT_EQ(milliseconds(2), config.presence_timeout);
    EXPECT_EQ(milliseconds(250), config.scan_timeout);

    EXPECT_THROW(parse_config({{"scan_timeout", "0.0005"}}), ConfigError);
    EXPECT_THROW(parse_config({{"scan_interval", "0.001"}}), ConfigError);
    EXPECT_THROW(parse_config({{"presence_timeout", "1e10"}}), ConfigError);
    EXPECT_THROW(parse_config({{"presence_timeout", "inf"}}), ConfigError);
    EXPECT_THROW(parse_config({{"presence_timeout", "nan"}}), ConfigError);
}

TEST(Config, ScanTimeoutMustBeShorterThanInterval)
{
    EXPECT_THROW(parse_config({{"scan_interval", "2"}, {"scan_timeout", "2"}}), ConfigError);
    EXPECT_NO_THROW(parse_config({{"scan_interval", "2"}, {"scan_timeout", "1.9"}}));
}

TEST(Config, UnknownKeyIsIgnored)
{
    Config config = parse_config({{"grace_seconds", "10"}});

    EXPECT_EQ(seconds(30), config.presence_timeout);
}

TEST_F(ConfigFileTest, LoadFile)
{
    write("# presence settings\n"
          "\n"
          "scan_interval = 1\n"
          "  presence_timeout=5  \n"
          "exclude_mac_prefixes = CC:DD\n"
          "this line is ignored\n");

    Config config = load_config(path);

    EXPECT_EQ(seconds(1), config.scan_interval);
    EXPECT_EQ(seconds(5), config.presence_timeout);
    ASSERT_EQ(1u, config.exclude_mac_prefixes.size());
    EXPECT_EQ("CC:DD", config.exclude_mac_prefixes[0]);
}

TEST_F(ConfigFileTest, EnvironmentOverridesFile)
{
    write("scan_interval = 1\n"
          "exclude_mac_prefixes = CC:DD\n");
    setenv("SCAN_INTERVAL", "3", 1);
    setenv("EXCLUDE_MAC_PREFIXES", "AA,BB", 1);

    Config config = load_config(path);

    EXPECT_EQ(seconds(3), config.scan_interval);
    ASSERT_EQ(2u, config.exclude_mac_prefixes.size());
    EXPECT_EQ("BB", config.exclude_mac_prefixes[1]);
}

TEST_F(ConfigFileTest, MissingFile)
{
    EXPECT_THROW(load_config(path + ".missing"), ConfigError);
}
