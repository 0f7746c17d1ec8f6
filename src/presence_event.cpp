#include "presence_event.hpp"

const char* presence_event_kind_str(PresenceEventKind kind)
{
    switch (kind) {
    case PRESENCE_NEW: return "NEW";
    case PRESENCE_LOST: return "LOST";
    default: return "UNKNOWN";
    }
}

PresenceEvent::PresenceEvent(PresenceEventKind kind,
                             std::chrono::system_clock::time_point timestamp,
                             const std::string &mac,
                             const std::string &name,
                             int rssi):
m_kind(kind),
m_timestamp(timestamp),
m_mac(mac),
m_name(name),
m_rssi(rssi)
{
}

PresenceEventKind PresenceEvent::getKind() const
{
    return m_kind;
}

std::chrono::system_clock::time_point PresenceEvent::getTimestamp() const
{
    return m_timestamp;
}

std::string PresenceEvent::getMAC() const
{
    return m_mac;
}

std::string PresenceEvent::getName() const
{
    return m_name;
}

int PresenceEvent::getRSSI() const
{
    return m_rssi;
}

bool operator<(const PresenceEvent &a, const PresenceEvent &b)
{
    if (a.getKind() != b.getKind())
        return a.getKind() < b.getKind();

    return a.getMAC() < b.getMAC();
}
