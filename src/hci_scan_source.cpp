#include "hci_scan_source.hpp"
#include "hci_parser.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sstream>
#include <sys/socket.h>
#include <unistd.h>

extern "C" {
#include <bluetooth/bluetooth.h>
#include <bluetooth/hci.h>
#include <bluetooth/hci_lib.h>
}

#define HCI_CMD_TIMEOUT         (1000)      /* in milliseconds */
#define INQUIRY_UNIT_MS         (1280)      /* inquiry length unit */
#define MAX_INQUIRY_LENGTH      (0x30)
#define LE_SCAN_INTERVAL        (0x0010)
#define LE_SCAN_WINDOW          (0x0010)

HciScanSource::HciScanSource(const Clock &clock, const std::string &adapter):
m_clock(clock),
m_adapter(adapter)
{
}

std::string HciScanSource::getName() const
{
    return m_adapter;
}

std::chrono::steady_clock::time_point HciScanSource::scanDeadline(std::chrono::steady_clock::time_point start,
                                                                  std::chrono::milliseconds timeout)
{
    /* Stopping takes at most one command timeout per HCI command */
    std::chrono::milliseconds reserve = std::min(timeout / 4, std::chrono::milliseconds(2 * HCI_CMD_TIMEOUT));
    return start + timeout - reserve;
}

int HciScanSource::openAdapter()
{
    int dev_id = hci_devid(m_adapter.c_str());
    if (dev_id < 0)
        throw ScanUnavailable("Bluetooth adapter " + m_adapter + " not found");

    int dd = hci_open_dev(dev_id);
    if (dd < 0) {
        std::stringstream ss;
        ss << "Failed to open adapter " << m_adapter << ": " << strerror(errno);
        throw ScanUnavailable(ss.str());
    }

    return dd;
}

bool HciScanSource::startInquiry(int dd, std::chrono::milliseconds timeout)
{
    if (timeout.count() <= 0)
        return false;

    /* Mode 2: results with RSSI or extended inquiry results */
    if (hci_write_inquiry_mode(dd, 2, HCI_CMD_TIMEOUT) < 0)
        return false;

    unsigned int length = timeout.count() / INQUIRY_UNIT_MS;
    if (length == 0)
        length = 1;
    if (length > MAX_INQUIRY_LENGTH)
        length = MAX_INQUIRY_LENGTH;

    inquiry_cp cp;
    memset(&cp, 0, sizeof(cp));
    /* General inquiry access code */
    cp.lap[0] = 0x33;
    cp.lap[1] = 0x8b;
    cp.lap[2] = 0x9e;
    cp.length = length;
    cp.num_rsp = 0;

    return hci_send_cmd(dd, OGF_LINK_CTL, OCF_INQUIRY, INQUIRY_CP_SIZE, &cp) >= 0;
}

std::vector<Sighting> HciScanSource::scan(std::chrono::milliseconds timeout)
{
    auto deadline = scanDeadline(std::chrono::steady_clock::now(), timeout);

    std::vector<Sighting> sightings;
    int dd = openAdapter();

    if (hci_le_set_scan_parameters(dd, 0x00, htobs(LE_SCAN_INTERVAL), htobs(LE_SCAN_WINDOW),
                                   LE_PUBLIC_ADDRESS, 0x00, HCI_CMD_TIMEOUT) < 0) {
        std::stringstream ss;
        ss << "Failed to set LE scan parameters on " << m_adapter << ": " << strerror(errno);
        hci_close_dev(dd);
        throw ScanUnavailable(ss.str());
    }

    /* Keep duplicates so the RSSI of each report is as recent as possible */
    if (hci_le_set_scan_enable(dd, 0x01, 0x00, HCI_CMD_TIMEOUT) < 0) {
        std::stringstream ss;
        ss << "Failed to enable LE scan on " << m_adapter << ": " << strerror(errno);
        hci_close_dev(dd);
        throw ScanUnavailable(ss.str());
    }

    struct hci_filter nf;
    hci_filter_clear(&nf);
    hci_filter_set_ptype(HCI_EVENT_PKT, &nf);
    hci_filter_set_event(EVT_LE_META_EVENT, &nf);
    hci_filter_set_event(EVT_INQUIRY_RESULT_WITH_RSSI, &nf);
    hci_filter_set_event(EVT_EXTENDED_INQUIRY_RESULT, &nf);
    if (setsockopt(dd, SOL_HCI, HCI_FILTER, &nf, sizeof(nf)) < 0) {
        std::stringstream ss;
        ss << "Failed to set HCI filter on " << m_adapter << ": " << strerror(errno);
        hci_le_set_scan_enable(dd, 0x00, 0x00, HCI_CMD_TIMEOUT);
        hci_close_dev(dd);
        throw ScanUnavailable(ss.str());
    }

    bool inquiry = startInquiry(dd, std::chrono::duration_cast<std::chrono::milliseconds>(
                                        deadline - std::chrono::steady_clock::now()));
    if (!inquiry) {
        std::stringstream ss;
        ss << "Classic inquiry not available on " << m_adapter << ", scanning LE only";
        Logger::debug(ss.str());
    }

    std::string error;
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
            break;

        struct pollfd fds[1];
        fds[0].fd = dd;
        fds[0].events = POLLIN;
        int ret = poll(fds, 1, remaining.count());
        if (ret < 0) {
            if (errno == EINTR)
                continue;
            error = strerror(errno);
            break;
        } else if (ret == 0) {
            continue;
        }

        uint8_t buf[HCI_MAX_EVENT_SIZE];
        int len = read(dd, buf, sizeof(buf));
        if (len < 0) {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            error = strerror(errno);
            break;
        }

        parse_hci_event(buf, static_cast<size_t>(len), m_clock.now(), sightings);
    }

    if (inquiry)
        hci_send_cmd(dd, OGF_LINK_CTL, OCF_INQUIRY_CANCEL, 0, NULL);
    hci_le_set_scan_enable(dd, 0x00, 0x00, HCI_CMD_TIMEOUT);
    hci_close_dev(dd);

    if (!error.empty())
        throw ScanUnavailable("Failed to read from adapter " + m_adapter + ": " + error);

    return sightings;
}
