#ifndef SIGHTING_HPP
#define SIGHTING_HPP

#include <chrono>
#include <string>

/* One observation of a device during a scan window */
struct Sighting {
    std::string mac;
    std::string name;
    int rssi;
    std::chrono::steady_clock::time_point observed_at;
    std::string address_type;
};

#endif
