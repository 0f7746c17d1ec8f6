#include "simulated_scan_source.hpp"
#include "logger.hpp"
#include <cstdio>
#include <sstream>

#define DEVICE_LEAVE_PROBABILITY    (0.1)
#define DEVICE_ARRIVE_PROBABILITY   (0.3)
#define RSSI_JITTER                 (2)     /* in dBm */
#define MIN_ARRIVAL_RSSI            (-80)   /* in dBm */
#define MAX_ARRIVAL_RSSI            (-40)   /* in dBm */

SimulatedScanSource::SimulatedScanSource(const Clock &clock, unsigned int seed, double failure_rate):
m_clock(clock),
m_random(seed),
m_failure_rate(failure_rate),
m_counter(0),
m_active()
{
}

std::vector<Sighting> SimulatedScanSource::scan(std::chrono::milliseconds timeout)
{
    (void) timeout;     /* Never blocks */

    if (m_failure_rate > 0. && chance(m_failure_rate))
        throw ScanUnavailable("Simulated adapter failure");

    auto ts = m_clock.now();
    std::vector<Sighting> sightings;

    auto it = m_active.begin();
    while (it != m_active.end()) {
        if (chance(DEVICE_LEAVE_PROBABILITY)) {
            it = m_active.erase(it);
            continue;
        }

        std::uniform_int_distribution<int> jitter(-RSSI_JITTER, RSSI_JITTER);
        it->second.rssi += jitter(m_random);

        Sighting s;
        s.mac = it->first;
        s.name = it->second.name;
        s.rssi = it->second.rssi;
        s.observed_at = ts;
        s.address_type = "public";
        sightings.push_back(s);
        ++it;
    }

    if (chance(DEVICE_ARRIVE_PROBABILITY)) {
        std::uniform_int_distribution<int> rssi(MIN_ARRIVAL_RSSI, MAX_ARRIVAL_RSSI);
        std::string mac = newMAC();

        SimulatedDevice d;
        d.name = "Sim" + mac.substr(mac.length() - 2);
        d.rssi = rssi(m_random);
        m_active[mac] = d;

        {
            std::stringstream ss;
            ss << "Simulated device " << mac << " appeared";
            Logger::debug(ss.str());
        }

        Sighting s;
        s.mac = mac;
        s.name = d.name;
        s.rssi = d.rssi;
        s.observed_at = ts;
        s.address_type = "public";
        sightings.push_back(s);
    }

    return sightings;
}

std::string SimulatedScanSource::getName() const
{
    return "simulator";
}

std::string SimulatedScanSource::newMAC()
{
    m_counter++;

    char buf[32];
    snprintf(buf, sizeof(buf), "02:00:00:00:%02X:%02X", (m_counter >> 8) & 0xFF, m_counter & 0xFF);
    return std::string(buf);
}

bool SimulatedScanSource::chance(double probability)
{
    std::uniform_real_distribution<double> dist(0., 1.);
    return dist(m_random) < probability;
}
