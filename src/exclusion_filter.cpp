#include "exclusion_filter.hpp"
#include "mac_address.hpp"

bool is_excluded(const std::string &mac, const std::vector<std::string> &prefixes)
{
    return ExclusionFilter(prefixes).isExcluded(canonicalize_mac_prefix(mac));
}

ExclusionFilter::ExclusionFilter(const std::vector<std::string> &prefixes):
m_prefixes()
{
    for (auto &p : prefixes) {
        std::string prefix = canonicalize_mac_prefix(p);
        /* An empty prefix would match every device */
        if (!prefix.empty())
            m_prefixes.push_back(prefix);
    }
}

bool ExclusionFilter::isExcluded(const std::string &mac) const
{
    for (auto &prefix : m_prefixes) {
        if (mac.rfind(prefix, 0) == 0)
            return true;
    }

    return false;
}

const std::vector<std::string>& ExclusionFilter::getPrefixes() const
{
    return m_prefixes;
}
