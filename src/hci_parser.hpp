#ifndef HCI_PARSER_HPP
#define HCI_PARSER_HPP

#include "sighting.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/*
 * Decoding of HCI events received while scanning.
 *
 * Every byte comes from the radio: lengths found in the data are checked
 * against the buffer and anything truncated is ignored.
 */

/**
 * @brief Extract the local name from advertising or extended inquiry data
 *
 * @return complete or shortened name, empty if none is present
 */
std::string parse_eir_name(const uint8_t *data, size_t len);

/**
 * @brief Decode the reports of an LE advertising report subevent
 *
 * @param data subevent parameters, starting with the number of reports
 * @param len number of bytes available in data
 * @param ts time stamped on the sightings
 * @param sightings receives one sighting per complete report
 */
void parse_advertising_reports(const uint8_t *data, size_t len,
                               std::chrono::steady_clock::time_point ts,
                               std::vector<Sighting> &sightings);

/**
 * @brief Decode an HCI event packet read from the adapter
 *
 * Handles LE advertising reports, inquiry results with RSSI and
 * extended inquiry results. Other events are ignored.
 *
 * @param buf packet, starting with the packet type
 * @param len number of bytes read
 */
void parse_hci_event(const uint8_t *buf, size_t len,
                     std::chrono::steady_clock::time_point ts,
                     std::vector<Sighting> &sightings);

#endif
