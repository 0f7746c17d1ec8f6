#ifndef SIMULATED_SCAN_SOURCE_HPP
#define SIMULATED_SCAN_SOURCE_HPP

#include "clock.hpp"
#include "scan_source.hpp"
#include <map>
#include <random>
#include <string>

/*
 * Synthesizes a changing cast of devices without touching any hardware.
 *
 * Devices are given locally administered addresses 02:00:00:00:00:NN.
 * The sequence only depends on the seed.
 */
class SimulatedScanSource : public ScanSource {
public:
    SimulatedScanSource(const Clock &clock, unsigned int seed, double failure_rate = 0.);

    std::vector<Sighting> scan(std::chrono::milliseconds timeout) override;
    std::string getName() const override;

private:
    struct SimulatedDevice {
        std::string name;
        int rssi;
    };

    std::string newMAC();
    bool chance(double probability);

    const Clock &m_clock;
    std::mt19937 m_random;
    double m_failure_rate;
    unsigned int m_counter;
    std::map<std::string, SimulatedDevice> m_active;
};

#endif
