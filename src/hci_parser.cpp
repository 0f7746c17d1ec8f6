#include "hci_parser.hpp"
#include "mac_address.hpp"

extern "C" {
#include <bluetooth/bluetooth.h>
#include <bluetooth/hci.h>
}

#define EIR_NAME_SHORT          (0x08)
#define EIR_NAME_COMPLETE       (0x09)

namespace {

std::string bdaddr_to_string(const bdaddr_t &addr)
{
    char buf[18];
    ba2str(&addr, buf);
    return canonicalize_mac(buf);
}

}

std::string parse_eir_name(const uint8_t *data, size_t len)
{
    size_t idx = 0;
    while (idx + 2 <= len) {
        uint8_t field_len = data[idx];
        if (field_len == 0)
            break;
        if (idx + 1 + field_len > len)
            break;

        uint8_t type = data[idx + 1];
        if (type == EIR_NAME_COMPLETE || type == EIR_NAME_SHORT)
            return std::string(reinterpret_cast<const char*>(&data[idx + 2]), field_len - 1);

        idx += 1 + field_len;
    }

    return std::string();
}

void parse_advertising_reports(const uint8_t *data, size_t len,
                               std::chrono::steady_clock::time_point ts,
                               std::vector<Sighting> &sightings)
{
    if (len < 1)
        return;

    uint8_t num_reports = data[0];
    size_t offset = 1;
    for (uint8_t i = 0; i < num_reports; ++i) {
        if (offset + LE_ADVERTISING_INFO_SIZE > len)
            break;

        const le_advertising_info *info = reinterpret_cast<const le_advertising_info*>(data + offset);
        /* RSSI follows the advertising data */
        size_t report_len = LE_ADVERTISING_INFO_SIZE + info->length + 1;
        if (offset + report_len > len)
            break;

        Sighting s;
        s.mac = bdaddr_to_string(info->bdaddr);
        s.name = parse_eir_name(info->data, info->length);
        s.rssi = static_cast<int8_t>(info->data[info->length]);
        s.observed_at = ts;
        s.address_type = info->bdaddr_type == LE_RANDOM_ADDRESS ? "random" : "public";
        sightings.push_back(s);

        offset += report_len;
    }
}

void parse_hci_event(const uint8_t *buf, size_t len,
                     std::chrono::steady_clock::time_point ts,
                     std::vector<Sighting> &sightings)
{
    /* Packet type, event header, parameters */
    if (len < 1 + HCI_EVENT_HDR_SIZE || buf[0] != HCI_EVENT_PKT)
        return;

    const hci_event_hdr *hdr = reinterpret_cast<const hci_event_hdr*>(buf + 1);
    const uint8_t *data = buf + 1 + HCI_EVENT_HDR_SIZE;
    size_t data_len = len - 1 - HCI_EVENT_HDR_SIZE;

    switch (hdr->evt) {
    case EVT_LE_META_EVENT:
    {
        if (data_len < 1)
            return;
        const evt_le_meta_event *meta = reinterpret_cast<const evt_le_meta_event*>(data);
        if (meta->subevent != EVT_LE_ADVERTISING_REPORT)
            return;
        parse_advertising_reports(meta->data, data_len - 1, ts, sightings);
        break;
    }
    case EVT_INQUIRY_RESULT_WITH_RSSI:
    {
        if (data_len < 1)
            return;
        uint8_t num = data[0];
        for (uint8_t i = 0; i < num; ++i) {
            size_t offset = 1 + i * INQUIRY_INFO_WITH_RSSI_SIZE;
            if (offset + INQUIRY_INFO_WITH_RSSI_SIZE > data_len)
                break;
            const inquiry_info_with_rssi *info = reinterpret_cast<const inquiry_info_with_rssi*>(data + offset);

            Sighting s;
            s.mac = bdaddr_to_string(info->bdaddr);
            s.rssi = static_cast<int8_t>(info->rssi);
            s.observed_at = ts;
            s.address_type = "public";
            sightings.push_back(s);
        }
        break;
    }
    case EVT_EXTENDED_INQUIRY_RESULT:
    {
        if (data_len < 1 + EXTENDED_INQUIRY_INFO_SIZE)
            return;
        const extended_inquiry_info *info = reinterpret_cast<const extended_inquiry_info*>(data + 1);

        Sighting s;
        s.mac = bdaddr_to_string(info->bdaddr);
        s.name = parse_eir_name(info->data, sizeof(info->data));
        s.rssi = static_cast<int8_t>(info->rssi);
        s.observed_at = ts;
        s.address_type = "public";
        sightings.push_back(s);
        break;
    }
    default:
        break;
    }
}
