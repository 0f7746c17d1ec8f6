#ifndef HCI_SCAN_SOURCE_HPP
#define HCI_SCAN_SOURCE_HPP

#include "clock.hpp"
#include "scan_source.hpp"
#include <string>
#include <vector>

/*
 * Live scan through a BlueZ HCI socket.
 *
 * Each call opens the adapter, runs an LE scan and a Classic inquiry
 * (when the controller accepts it) until the timeout expires, then
 * stops both and closes the adapter. Requires CAP_NET_RAW/CAP_NET_ADMIN.
 */
class HciScanSource : public ScanSource {
public:
    HciScanSource(const Clock &clock, const std::string &adapter);

    std::vector<Sighting> scan(std::chrono::milliseconds timeout) override;
    std::string getName() const override;

    /**
     * @brief End of the listening window of a scan started at start
     *
     * Adapter setup happens inside the window. Time is kept after it
     * to stop scanning before the timeout expires.
     */
    static std::chrono::steady_clock::time_point scanDeadline(std::chrono::steady_clock::time_point start,
                                                              std::chrono::milliseconds timeout);

private:
    int openAdapter();
    bool startInquiry(int dd, std::chrono::milliseconds timeout);

    const Clock &m_clock;
    std::string m_adapter;
};

#endif
