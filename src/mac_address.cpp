#include "mac_address.hpp"
#include <cctype>

namespace {

bool is_hex_digit(char c)
{
    return (c >= '0' && c <= '9')
        || (c >= 'a' && c <= 'f')
        || (c >= 'A' && c <= 'F');
}

}

std::string canonicalize_mac(const std::string &mac)
{
    /* 6 octets of 2 digits and 5 separators */
    if (mac.length() != 17)
        return std::string();

    std::string canonical;
    canonical.reserve(mac.length());
    for (unsigned int i = 0; i < mac.length(); ++i) {
        char c = mac[i];
        if (i % 3 == 2) {
            if (c != ':' && c != '-')
                return std::string();
            canonical += ':';
        } else {
            if (!is_hex_digit(c))
                return std::string();
            canonical += toupper(static_cast<unsigned char>(c));
        }
    }

    return canonical;
}

std::string canonicalize_mac_prefix(const std::string &prefix)
{
    std::string canonical;
    canonical.reserve(prefix.length());
    for (auto c : prefix) {
        if (c == '-')
            canonical += ':';
        else
            canonical += toupper(static_cast<unsigned char>(c));
    }

    return canonical;
}
