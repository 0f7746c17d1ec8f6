#include "device_registry.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {

const std::chrono::system_clock::time_point WALL_TIME(seconds(1714557600));

class DeviceRegistryTest : public ::testing::Test {
protected:
    DeviceRegistryTest():
    t0(seconds(1000))
    {
        policy.presence_timeout = seconds(10);
        policy.weak_signal_timeout = seconds(10);
    }

    std::vector<PresenceEvent> see(DeviceRegistry &registry, const std::string &mac, int rssi,
                                   std::chrono::steady_clock::time_point at,
                                   const std::string &name = "Test")
    {
        return registry.applyScan({make_sighting(mac, name, rssi, at)}, WALL_TIME);
    }

    PresencePolicy policy;
    std::chrono::steady_clock::time_point t0;
};

}

TEST_F(DeviceRegistryTest, FirstSightingCreatesPresentRecord)
{
    DeviceRegistry registry(policy);

    auto events = see(registry, "AA:BB:CC:DD:EE:01", -50, t0);

    ASSERT_EQ(1u, events.size());
    EXPECT_EQ(PRESENCE_NEW, events[0].getKind());
    EXPECT_EQ("AA:BB:CC:DD:EE:01", events[0].getMAC());
    EXPECT_EQ("Test", events[0].getName());
    EXPECT_EQ(-50, events[0].getRSSI());
    EXPECT_EQ(WALL_TIME, events[0].getTimestamp());

    const DeviceRecord *record = registry.find("AA:BB:CC:DD:EE:01");
    ASSERT_NE(nullptr, record);
    EXPECT_EQ(DEVICE_PRESENT, record->state);
    EXPECT_EQ(t0, record->first_seen_at);
    EXPECT_EQ(t0, record->last_seen_at);
}

TEST_F(DeviceRegistryTest, RepeatedSightingsDoNotEmitNew)
{
    DeviceRegistry registry(policy);

    EXPECT_EQ(1u, see(registry, "AA:BB:CC:DD:EE:01", -50, t0).size());
    for (int i = 1; i < 20; ++i) {
        auto now = t0 + seconds(i * 5);
        EXPECT_TRUE(see(registry, "AA:BB:CC:DD:EE:01", -50 - i, now).empty());
        EXPECT_TRUE(registry.sweep(now, WALL_TIME).empty());
    }

    const DeviceRecord *record = registry.find("AA:BB:CC:DD:EE:01");
    ASSERT_NE(nullptr, record);
    EXPECT_EQ(t0, record->first_seen_at);
    EXPECT_EQ(t0 + seconds(95), record->last_seen_at);
    EXPECT_EQ(-69, record->rssi);
}

TEST_F(DeviceRegistryTest, SightingWithoutNameKeepsKnownName)
{
    DeviceRegistry registry(policy);

    see(registry, "AA:BB:CC:DD:EE:01", -50, t0, "Sensor");
    see(registry, "AA:BB:CC:DD:EE:01", -52, t0 + seconds(1), "");

    EXPECT_EQ("Sensor", registry.find("AA:BB:CC:DD:EE:01")->name);

    see(registry, "AA:BB:CC:DD:EE:01", -52, t0 + seconds(2), "Renamed");
    EXPECT_EQ("Renamed", registry.find("AA:BB:CC:DD:EE:01")->name);
}

TEST_F(DeviceRegistryTest, LostOnlyAfterTimeoutIsExceeded)
{
    DeviceRegistry registry(policy);
    see(registry, "AA:BB:CC:DD:EE:01", -50, t0, "Sensor");
    see(registry, "AA:BB:CC:DD:EE:01", -61, t0 + seconds(2), "Sensor");

    EXPECT_TRUE(registry.sweep(t0 + seconds(11), WALL_TIME).empty());
    /* Exactly at the timeout the device is still present */
    EXPECT_TRUE(registry.sweep(t0 + seconds(12), WALL_TIME).empty());

    auto events = registry.sweep(t0 + seconds(12) + milliseconds(1), WALL_TIME);
    ASSERT_EQ(1u, events.size());
    EXPECT_EQ(PRESENCE_LOST, events[0].getKind());
    EXPECT_EQ("Sensor", events[0].getName());
    EXPECT_EQ(-61, events[0].getRSSI());
    EXPECT_FALSE(registry.contains("AA:BB:CC:DD:EE:01"));

    /* Only once */
    EXPECT_TRUE(registry.sweep(t0 + seconds(60), WALL_TIME).empty());
}

TEST_F(DeviceRegistryTest, ReappearingDeviceGetsNewEvent)
{
    DeviceRegistry registry(policy);
    see(registry, "AA:BB:CC:DD:EE:01", -50, t0);
    ASSERT_EQ(1u, registry.sweep(t0 + seconds(11), WALL_TIME).size());

    auto events = see(registry, "AA:BB:CC:DD:EE:01", -70, t0 + seconds(12));
    ASSERT_EQ(1u, events.size());
    EXPECT_EQ(PRESENCE_NEW, events[0].getKind());
    EXPECT_EQ(-70, events[0].getRSSI());
    EXPECT_EQ(t0 + seconds(12), registry.find("AA:BB:CC:DD:EE:01")->first_seen_at);
}

TEST_F(DeviceRegistryTest, SightingsOfOneScanAreFolded)
{
    DeviceRegistry registry(policy);

    std::vector<Sighting> sightings = {
        make_sighting("AA:BB:CC:DD:EE:01", "Early", -40, t0 + seconds(2)),
        make_sighting("AA:BB:CC:DD:EE:01", "", -45, t0 + seconds(3)),
        make_sighting("AA:BB:CC:DD:EE:01", "Oldest", -30, t0),
    };
    auto events = registry.applyScan(sightings, WALL_TIME);

    ASSERT_EQ(1u, events.size());
    EXPECT_EQ("Early", events[0].getName());
    EXPECT_EQ(-45, events[0].getRSSI());
    EXPECT_EQ(1u, registry.size());
    EXPECT_EQ(t0 + seconds(3), registry.find("AA:BB:CC:DD:EE:01")->last_seen_at);
}

TEST_F(DeviceRegistryTest, EventsAreSortedByMAC)
{
    DeviceRegistry registry(policy);

    std::vector<Sighting> sightings = {
        make_sighting("CC:00:00:00:00:01", "C", -40, t0),
        make_sighting("AA:00:00:00:00:01", "A", -40, t0),
        make_sighting("BB:00:00:00:00:01", "B", -40, t0),
    };
    auto events = registry.applyScan(sightings, WALL_TIME);
    ASSERT_EQ(3u, events.size());
    EXPECT_EQ("AA:00:00:00:00:01", events[0].getMAC());
    EXPECT_EQ("BB:00:00:00:00:01", events[1].getMAC());
    EXPECT_EQ("CC:00:00:00:00:01", events[2].getMAC());

    auto lost = registry.sweep(t0 + seconds(11), WALL_TIME);
    ASSERT_EQ(3u, lost.size());
    EXPECT_EQ("AA:00:00:00:00:01", lost[0].getMAC());
    EXPECT_EQ("CC:00:00:00:00:01", lost[2].getMAC());
}

TEST_F(DeviceRegistryTest, WeakSignalUsesLongerTimeout)
{
    policy.weak_signal_timeout = seconds(20);
    policy.weak_signal_threshold = -90;
    DeviceRegistry registry(policy);

    see(registry, "AA:BB:CC:DD:EE:01", -50, t0);
    see(registry, "AA:BB:CC:DD:EE:02", -95, t0);

    auto events = registry.sweep(t0 + seconds(11), WALL_TIME);
    ASSERT_EQ(1u, events.size());
    EXPECT_EQ("AA:BB:CC:DD:EE:01", events[0].getMAC());

    EXPECT_TRUE(registry.sweep(t0 + seconds(20), WALL_TIME).empty());
    events = registry.sweep(t0 + seconds(21), WALL_TIME);
    ASSERT_EQ(1u, events.size());
    EXPECT_EQ("AA:BB:CC:DD:EE:02", events[0].getMAC());
}

TEST_F(DeviceRegistryTest, ConfirmationScansDelayNew)
{
    policy.confirm_scans = 2;
    DeviceRegistry registry(policy);

    EXPECT_TRUE(see(registry, "AA:BB:CC:DD:EE:01", -50, t0).empty());
    EXPECT_EQ(DEVICE_PENDING, registry.find("AA:BB:CC:DD:EE:01")->state);

    auto events = see(registry, "AA:BB:CC:DD:EE:01", -50, t0 + seconds(1));
    ASSERT_EQ(1u, events.size());
    EXPECT_EQ(PRESENCE_NEW, events[0].getKind());
    EXPECT_EQ(DEVICE_PRESENT, registry.find("AA:BB:CC:DD:EE:01")->state);

    EXPECT_TRUE(see(registry, "AA:BB:CC:DD:EE:01", -50, t0 + seconds(2)).empty());
}

TEST_F(DeviceRegistryTest, MissedScanResetsConfirmation)
{
    policy.confirm_scans = 2;
    DeviceRegistry registry(policy);

    EXPECT_TRUE(see(registry, "AA:BB:CC:DD:EE:01", -50, t0).empty());
    EXPECT_TRUE(registry.applyScan({}, WALL_TIME).empty());
    EXPECT_TRUE(see(registry, "AA:BB:CC:DD:EE:01", -50, t0 + seconds(2)).empty());
    EXPECT_EQ(1u, see(registry, "AA:BB:CC:DD:EE:01", -50, t0 + seconds(3)).size());
}

TEST_F(DeviceRegistryTest, UnconfirmedDeviceTimesOutSilently)
{
    policy.confirm_scans = 3;
    DeviceRegistry registry(policy);

    see(registry, "AA:BB:CC:DD:EE:01", -50, t0);
    EXPECT_TRUE(registry.sweep(t0 + seconds(11), WALL_TIME).empty());
    EXPECT_FALSE(registry.contains("AA:BB:CC:DD:EE:01"));
    EXPECT_TRUE(registry.getPresentDevices().empty());
}

TEST_F(DeviceRegistryTest, PresentDevicesExcludePending)
{
    policy.confirm_scans = 2;
    DeviceRegistry registry(policy);

    see(registry, "AA:BB:CC:DD:EE:01", -50, t0);
    see(registry, "AA:BB:CC:DD:EE:01", -50, t0 + seconds(1));
    see(registry, "AA:BB:CC:DD:EE:02", -50, t0 + seconds(1));

    auto present = registry.getPresentDevices();
    ASSERT_EQ(1u, present.size());
    EXPECT_EQ("AA:BB:CC:DD:EE:01", present[0].mac);
    EXPECT_EQ(2u, registry.size());
}
