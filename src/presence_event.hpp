#ifndef PRESENCE_EVENT_HPP
#define PRESENCE_EVENT_HPP

#include <chrono>
#include <string>

enum PresenceEventKind {
    PRESENCE_NEW,
    PRESENCE_LOST,
};

const char* presence_event_kind_str(PresenceEventKind kind);

class PresenceEvent {
public:
    PresenceEvent(PresenceEventKind kind,
                  std::chrono::system_clock::time_point timestamp,
                  const std::string &mac,
                  const std::string &name,
                  int rssi);

    PresenceEventKind getKind() const;
    std::chrono::system_clock::time_point getTimestamp() const;
    std::string getMAC() const;
    std::string getName() const;
    int getRSSI() const;

private:
    PresenceEventKind m_kind;
    std::chrono::system_clock::time_point m_timestamp;
    std::string m_mac;
    std::string m_name;
    int m_rssi;
};

/* NEW before LOST, then by ascending MAC address */
bool operator<(const PresenceEvent &a, const PresenceEvent &b);

#endif
