#include "device_registry.hpp"
#include "logger.hpp"
#include <sstream>

#define DEFAULT_PRESENCE_TIMEOUT    (30 * 1000)     /* in milliseconds */

PresencePolicy::PresencePolicy():
presence_timeout(DEFAULT_PRESENCE_TIMEOUT),
weak_signal_timeout(DEFAULT_PRESENCE_TIMEOUT),
weak_signal_threshold(-90),
confirm_scans(1)
{
}

DeviceRegistry::DeviceRegistry(const PresencePolicy &policy):
m_policy(policy),
m_devices()
{
    if (m_policy.confirm_scans == 0)
        m_policy.confirm_scans = 1;
}

std::vector<PresenceEvent> DeviceRegistry::applyScan(const std::vector<Sighting> &sightings,
                                                     std::chrono::system_clock::time_point timestamp)
{
    /* Fold sightings per device: keep the most recent one and its last known name */
    std::map<std::string, Sighting> latest;
    for (auto &s : sightings) {
        auto it = latest.find(s.mac);
        if (it == latest.end()) {
            latest[s.mac] = s;
            continue;
        }

        Sighting &folded = it->second;
        if (s.observed_at >= folded.observed_at) {
            std::string name = s.name.empty() ? folded.name : s.name;
            folded = s;
            folded.name = name;
        } else if (folded.name.empty()) {
            folded.name = s.name;
        }
    }

    std::vector<PresenceEvent> events;

    /* Devices still waiting for confirmation lose their streak when missed */
    for (auto &e : m_devices) {
        DeviceRecord &record = e.second;
        if (record.state == DEVICE_PENDING && latest.find(e.first) == latest.end())
            record.consecutive_scans = 0;
    }

    for (auto &e : latest) {
        const Sighting &s = e.second;
        auto it = m_devices.find(s.mac);

        if (it == m_devices.end()) {
            DeviceRecord record;
            record.mac = s.mac;
            record.name = s.name;
            record.rssi = s.rssi;
            record.first_seen_at = s.observed_at;
            record.last_seen_at = s.observed_at;
            record.consecutive_scans = 1;
            record.state = DEVICE_PENDING;
            it = m_devices.insert(std::make_pair(s.mac, record)).first;
        } else {
            DeviceRecord &record = it->second;
            if (s.observed_at > record.last_seen_at)
                record.last_seen_at = s.observed_at;
            record.rssi = s.rssi;
            if (!s.name.empty())
                record.name = s.name;
            if (record.state == DEVICE_PENDING)
                record.consecutive_scans++;
        }

        DeviceRecord &record = it->second;
        if (record.state == DEVICE_PENDING && record.consecutive_scans >= m_policy.confirm_scans) {
            record.state = DEVICE_PRESENT;
            events.push_back(PresenceEvent(PRESENCE_NEW, timestamp, record.mac, record.name, record.rssi));
        }
    }

    return events;
}

std::vector<PresenceEvent> DeviceRegistry::sweep(std::chrono::steady_clock::time_point now,
                                                 std::chrono::system_clock::time_point timestamp)
{
    std::vector<PresenceEvent> events;

    auto it = m_devices.begin();
    while (it != m_devices.end()) {
        const DeviceRecord &record = it->second;
        if (now - record.last_seen_at <= timeoutFor(record)) {
            ++it;
            continue;
        }

        if (record.state == DEVICE_PRESENT) {
            events.push_back(PresenceEvent(PRESENCE_LOST, timestamp, record.mac, record.name, record.rssi));
        } else {
            std::stringstream ss;
            ss << "Dropping unconfirmed device " << record.mac;
            Logger::debug(ss.str());
        }
        it = m_devices.erase(it);
    }

    return events;
}

bool DeviceRegistry::contains(const std::string &mac) const
{
    return m_devices.find(mac) != m_devices.end();
}

const DeviceRecord* DeviceRegistry::find(const std::string &mac) const
{
    auto it = m_devices.find(mac);
    if (it == m_devices.end())
        return nullptr;

    return &it->second;
}

size_t DeviceRegistry::size() const
{
    return m_devices.size();
}

std::vector<DeviceRecord> DeviceRegistry::getPresentDevices() const
{
    std::vector<DeviceRecord> devices;
    for (auto &e : m_devices) {
        if (e.second.state == DEVICE_PRESENT)
            devices.push_back(e.second);
    }

    return devices;
}

std::chrono::milliseconds DeviceRegistry::timeoutFor(const DeviceRecord &record) const
{
    if (record.rssi < m_policy.weak_signal_threshold)
        return m_policy.weak_signal_timeout;

    return m_policy.presence_timeout;
}
