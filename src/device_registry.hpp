#ifndef DEVICE_REGISTRY_HPP
#define DEVICE_REGISTRY_HPP

#include "presence_event.hpp"
#include "sighting.hpp"
#include <chrono>
#include <map>
#include <string>
#include <vector>

enum DeviceState {
    DEVICE_PENDING,     /* seen, waiting for confirmation scans */
    DEVICE_PRESENT,
};

struct DeviceRecord {
    std::string mac;
    std::string name;
    int rssi;
    std::chrono::steady_clock::time_point first_seen_at;
    std::chrono::steady_clock::time_point last_seen_at;
    DeviceState state;
    unsigned int consecutive_scans;
};

struct PresencePolicy {
    PresencePolicy();

    std::chrono::milliseconds presence_timeout;

    /* Devices whose last RSSI is below weak_signal_threshold use weak_signal_timeout */
    std::chrono::milliseconds weak_signal_timeout;
    int weak_signal_threshold;

    /* Number of consecutive scans a device must appear in before NEW */
    unsigned int confirm_scans;
};

/*
 * Presence state of every tracked device, one record per MAC address.
 *
 * A device without record is absent. Records are removed as soon as
 * they time out so that a device seen again always gets a new NEW event.
 */
class DeviceRegistry {
public:
    explicit DeviceRegistry(const PresencePolicy &policy);

    /**
     * @brief Apply the result of one successful scan
     *
     * Sightings must carry canonical MAC addresses. Several sightings of
     * the same device are folded into one update.
     *
     * @param sightings every accepted sighting of the scan window
     * @param timestamp wall clock time stamped on emitted events
     * @return NEW events, sorted by MAC address
     */
    std::vector<PresenceEvent> applyScan(const std::vector<Sighting> &sightings,
                                         std::chrono::system_clock::time_point timestamp);

    /**
     * @brief Remove devices not seen for longer than their timeout
     *
     * @param now current monotonic time
     * @param timestamp wall clock time stamped on emitted events
     * @return LOST events, sorted by MAC address
     */
    std::vector<PresenceEvent> sweep(std::chrono::steady_clock::time_point now,
                                     std::chrono::system_clock::time_point timestamp);

    bool contains(const std::string &mac) const;
    const DeviceRecord* find(const std::string &mac) const;
    size_t size() const;
    std::vector<DeviceRecord> getPresentDevices() const;

private:
    std::chrono::milliseconds timeoutFor(const DeviceRecord &record) const;

    PresencePolicy m_policy;
    std::map<std::string, DeviceRecord> m_devices;
};

#endif
