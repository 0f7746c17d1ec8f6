#ifndef SCAN_SOURCE_HPP
#define SCAN_SOURCE_HPP

#include "sighting.hpp"
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

/* The Bluetooth stack could not be queried. Not the same as "no device nearby". */
class ScanUnavailable : public std::runtime_error {
public:
    explicit ScanUnavailable(const std::string &what);
};

class ScanSource {
public:
    virtual ~ScanSource() = default;

    /**
     * @brief Collect the devices observable during one scan window
     *
     * Implementations must return within timeout.
     *
     * @param timeout upper bound on the duration of the call
     * @return every sighting of the window, possibly several per device
     * @throw ScanUnavailable if the underlying stack failed
     */
    virtual std::vector<Sighting> scan(std::chrono::milliseconds timeout) = 0;

    virtual std::string getName() const = 0;
};

#endif
