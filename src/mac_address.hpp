#ifndef MAC_ADDRESS_HPP
#define MAC_ADDRESS_HPP

#include <string>

/**
 * @brief Convert a MAC address to its canonical form
 *
 * Accepts six hex octets separated by ':' or '-', in any case.
 *
 * @param mac address as reported by the scanner
 * @return uppercase colon-separated address, or an empty string
 * if mac is not a valid address
 */
std::string canonicalize_mac(const std::string &mac);

/* Uppercase and replace '-' with ':'. Used for partial addresses. */
std::string canonicalize_mac_prefix(const std::string &prefix);

#endif
