#ifndef EVENT_LOG_HPP
#define EVENT_LOG_HPP

#include "presence_event.hpp"
#include "sighting.hpp"
#include <chrono>
#include <iostream>
#include <string>

/* ISO-8601 UTC timestamp with microseconds, e.g. 2024-05-01T10:00:00.000000+00:00 */
std::string format_timestamp(std::chrono::system_clock::time_point tp);

std::string format_json_line(const PresenceEvent &event);

/* Control characters of the name are replaced with '?' */
std::string format_console_line(const PresenceEvent &event);

/*
 * Outputs of the presence events.
 *
 * Every event is appended as one JSON object to the log file and printed
 * as KIND:MAC:NAME:RSSI on the console. The two outputs fail independently.
 */
class EventLog {
public:
    explicit EventLog(const std::string &path, std::ostream &console = std::cout);

    EventLog(const EventLog &l) = delete;
    EventLog& operator=(const EventLog &l) = delete;

    /**
     * @brief Write an event to both outputs
     *
     * @return true if both outputs were written
     */
    bool publish(const PresenceEvent &event);

    /* Log file only */
    bool logObservation(const Sighting &sighting, std::chrono::system_clock::time_point timestamp);

private:
    bool appendLine(const std::string &line);
    bool printLine(const std::string &line);

    std::string m_path;
    std::ostream &m_console;
    unsigned int m_file_error_counter;
    unsigned int m_console_error_counter;
};

#endif
