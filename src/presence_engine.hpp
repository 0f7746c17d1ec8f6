#ifndef PRESENCE_ENGINE_HPP
#define PRESENCE_ENGINE_HPP

#include "clock.hpp"
#include "config.hpp"
#include "device_registry.hpp"
#include "exclusion_filter.hpp"
#include "presence_event.hpp"
#include "scan_source.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <vector>

typedef std::function<void(const PresenceEvent&)> PresenceEventCallback;
typedef std::function<void(const Sighting&, std::chrono::system_clock::time_point)> ObservationCallback;

/* Copy of the engine state that can be read from any thread */
struct PresenceStatus {
    std::vector<DeviceRecord> devices;
    unsigned long long cycle_count;
    unsigned int scan_error_counter;
    std::chrono::system_clock::time_point last_cycle_time;
};

class PresenceEngine {
public:
    PresenceEngine(const Config &config, ScanSource &source, const Clock &clock,
                   PresenceEventCallback cb, ObservationCallback observation_cb = nullptr);

    PresenceEngine(const PresenceEngine &e) = delete;
    PresenceEngine& operator=(const PresenceEngine &e) = delete;

    /**
     * @brief Run one scan, update and sweep cycle
     *
     * Events are delivered to the callback before returning, NEW events
     * first, each group ordered by MAC address. A failed scan leaves every
     * device untouched.
     *
     * @return events emitted during this cycle
     */
    std::vector<PresenceEvent> runCycle();

    /**
     * @brief Run cycles every scan interval until running becomes false
     *
     * The cycle in progress always completes before returning.
     */
    void run(const std::atomic<bool> &running);

    /* Only valid from the thread running the cycles */
    const DeviceRegistry& getRegistry() const;

    PresenceStatus getStatus();

private:
    bool scan(std::vector<Sighting> &sightings);
    std::vector<Sighting> filterSightings(const std::vector<Sighting> &sightings);
    void reportScanFailure(const std::string &reason);
    void publishStatus();

    Config m_config;
    ScanSource &m_source;
    const Clock &m_clock;
    PresenceEventCallback m_callback;
    ObservationCallback m_observation_callback;

    ExclusionFilter m_filter;
    DeviceRegistry m_registry;

    unsigned long long m_cycle_count;
    unsigned int m_scan_error_counter;

    PresenceStatus m_status;
    std::mutex m_status_mutex;
};

#endif
