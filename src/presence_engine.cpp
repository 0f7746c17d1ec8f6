#include "presence_engine.hpp"
#include "logger.hpp"
#include "mac_address.hpp"
#include "timer.hpp"
#include <algorithm>
#include <sstream>

#define STOP_POLL_PERIOD    (100)   /* in milliseconds */

namespace {

PresencePolicy make_policy(const Config &config)
{
    PresencePolicy policy;
    policy.presence_timeout = config.presence_timeout;
    policy.weak_signal_timeout = config.weak_signal_timeout;
    policy.weak_signal_threshold = config.weak_signal_threshold;
    policy.confirm_scans = config.confirm_scans;
    return policy;
}

}

PresenceEngine::PresenceEngine(const Config &config, ScanSource &source, const Clock &clock,
                               PresenceEventCallback cb, ObservationCallback observation_cb):
m_config(config),
m_source(source),
m_clock(clock),
m_callback(cb),
m_observation_callback(observation_cb),
m_filter(config.exclude_mac_prefixes),
m_registry(make_policy(config)),
m_cycle_count(0),
m_scan_error_counter(0),
m_status(),
m_status_mutex()
{
    m_status.cycle_count = 0;
    m_status.scan_error_counter = 0;
}

std::vector<PresenceEvent> PresenceEngine::runCycle()
{
    std::vector<PresenceEvent> events;
    std::vector<Sighting> sightings;

    ++m_cycle_count;

    if (scan(sightings)) {
        std::vector<Sighting> accepted = filterSightings(sightings);

        if (m_observation_callback) {
            auto ts = m_clock.wallNow();
            for (auto &s : accepted)
                m_observation_callback(s, ts);
        }

        /* Sightings are applied before the sweep so that a device seen in this cycle is never lost */
        events = m_registry.applyScan(accepted, m_clock.wallNow());
        std::vector<PresenceEvent> lost = m_registry.sweep(m_clock.now(), m_clock.wallNow());
        events.insert(events.end(), lost.begin(), lost.end());
        std::stable_sort(events.begin(), events.end());

        for (auto &event : events) {
            if (m_callback)
                m_callback(event);
        }
    }

    publishStatus();

    return events;
}

void PresenceEngine::run(const std::atomic<bool> &running)
{
    Timer timer;
    /* Config durations fit in an unsigned int of milliseconds */
    timer.start(static_cast<unsigned int>(m_config.scan_interval.count()), true);

    {
        std::stringstream ss;
        ss << "Scanning with " << m_source.getName() << " every "
           << m_config.scan_interval.count() << "ms";
        Logger::info(ss.str());
    }

    while (running) {
        runCycle();

        /* The timer is periodic, so time spent scanning does not shift the schedule */
        uint64_t expirations = 0;
        while (running && expirations == 0)
            expirations = timer.wait(STOP_POLL_PERIOD);

        if (expirations > 1) {
            std::stringstream ss;
            ss << "Scan cycle overran, skipped " << expirations - 1 << " tick(s)";
            Logger::warn(ss.str());
        }
    }

    timer.stop();
    Logger::info("Presence engine stopped");
}

const DeviceRegistry& PresenceEngine::getRegistry() const
{
    return m_registry;
}

PresenceStatus PresenceEngine::getStatus()
{
    std::lock_guard<std::mutex> guard(m_status_mutex);
    return m_status;
}

bool PresenceEngine::scan(std::vector<Sighting> &sightings)
{
    auto start = m_clock.now();
    try {
        sightings = m_source.scan(m_config.scan_timeout);
    } catch (const ScanUnavailable &e) {
        reportScanFailure(e.what());
        return false;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(m_clock.now() - start);
    if (elapsed > m_config.scan_timeout) {
        std::stringstream ss;
        ss << "Scan took " << elapsed.count() << "ms, more than the "
           << m_config.scan_timeout.count() << "ms allowed. Discarding results.";
        reportScanFailure(ss.str());
        return false;
    }

    if (m_scan_error_counter) {
        std::stringstream ss;
        ss << "Scanning restored after " << m_scan_error_counter << " failed cycle(s)";
        Logger::info(ss.str());
        m_scan_error_counter = 0;
    }

    return true;
}

std::vector<Sighting> PresenceEngine::filterSightings(const std::vector<Sighting> &sightings)
{
    std::vector<Sighting> accepted;

    for (auto &s : sightings) {
        std::string mac = canonicalize_mac(s.mac);
        if (mac.empty()) {
            std::stringstream ss;
            ss << "Dropping sighting with malformed MAC address \"" << s.mac << '\"';
            Logger::warn(ss.str());
            continue;
        }

        if (m_filter.isExcluded(mac))
            continue;

        if (s.rssi < m_config.min_rssi)
            continue;

        Sighting c = s;
        c.mac = mac;
        accepted.push_back(c);
    }

    return accepted;
}

void PresenceEngine::reportScanFailure(const std::string &reason)
{
    ++m_scan_error_counter;

    std::stringstream ss;
    ss << "Scan with " << m_source.getName() << " failed: " << reason;
    if (m_scan_error_counter == 1) {
        Logger::warn(ss.str());
    } else {
        ss << " (" << m_scan_error_counter << " consecutive failures)";
        Logger::err(ss.str());
    }
}

void PresenceEngine::publishStatus()
{
    std::lock_guard<std::mutex> guard(m_status_mutex);
    m_status.devices = m_registry.getPresentDevices();
    m_status.cycle_count = m_cycle_count;
    m_status.scan_error_counter = m_scan_error_counter;
    m_status.last_cycle_time = m_clock.wallNow();
}
