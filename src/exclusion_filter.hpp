#ifndef EXCLUSION_FILTER_HPP
#define EXCLUSION_FILTER_HPP

#include <string>
#include <vector>

/**
 * @brief Check whether a MAC address matches one of the excluded prefixes
 *
 * Both the address and the prefixes are canonicalized before comparison,
 * so "aa-bb" excludes "AA:BB:CC:DD:EE:FF".
 *
 * @return true if the device must not be tracked
 */
bool is_excluded(const std::string &mac, const std::vector<std::string> &prefixes);

class ExclusionFilter {
public:
    explicit ExclusionFilter(const std::vector<std::string> &prefixes);

    /* mac must already be canonical */
    bool isExcluded(const std::string &mac) const;

    const std::vector<std::string>& getPrefixes() const;

private:
    std::vector<std::string> m_prefixes;
};

#endif
