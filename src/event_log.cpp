#include "event_log.hpp"
#include "logger.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <unistd.h>

namespace {

std::string display_name(const std::string &name)
{
    return name.empty() ? "N/A" : name;
}

/* Names come from the radio: a control character must not start a new console line */
std::string printable_name(const std::string &name)
{
    std::string out = display_name(name);
    for (auto &c : out) {
        unsigned char u = static_cast<unsigned char>(c);
        if (u < 0x20 || u == 0x7f)
            c = '?';
    }
    return out;
}

}

std::string format_timestamp(std::chrono::system_clock::time_point tp)
{
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
    long long secs = us / 1000000;
    long long frac = us % 1000000;
    if (frac < 0) {
        frac += 1000000;
        secs -= 1;
    }

    time_t tt = static_cast<time_t>(secs);
    struct tm utc_tm;
    gmtime_r(&tt, &utc_tm);

    char buf[64];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc_tm);

    char out[96];
    snprintf(out, sizeof(out), "%s.%06lld+00:00", buf, frac);
    return std::string(out);
}

std::string format_json_line(const PresenceEvent &event)
{
    nlohmann::ordered_json j;
    j["event"] = presence_event_kind_str(event.getKind());
    j["timestamp"] = format_timestamp(event.getTimestamp());
    j["mac"] = event.getMAC();
    j["name"] = display_name(event.getName());
    j["rssi_dBm"] = event.getRSSI();
    return j.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

std::string format_console_line(const PresenceEvent &event)
{
    std::stringstream ss;
    ss << presence_event_kind_str(event.getKind()) << ':'
       << event.getMAC() << ':'
       << printable_name(event.getName()) << ':'
       << event.getRSSI();
    return ss.str();
}

EventLog::EventLog(const std::string &path, std::ostream &console):
m_path(path),
m_console(console),
m_file_error_counter(0),
m_console_error_counter(0)
{
}

bool EventLog::publish(const PresenceEvent &event)
{
    /* Both outputs are attempted whatever happens to the other one */
    bool file_ok = appendLine(format_json_line(event));
    bool console_ok = printLine(format_console_line(event));

    return file_ok && console_ok;
}

bool EventLog::logObservation(const Sighting &sighting, std::chrono::system_clock::time_point timestamp)
{
    nlohmann::ordered_json j;
    j["event"] = "OBSERVATION";
    j["timestamp"] = format_timestamp(timestamp);
    j["mac"] = sighting.mac;
    j["name"] = display_name(sighting.name);
    j["address_type"] = sighting.address_type.empty() ? "N/A" : sighting.address_type;
    j["rssi_dBm"] = sighting.rssi;

    return appendLine(j.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace));
}

/*
 * The file is opened and closed for every line and synced before
 * returning so that a crash never loses an event already reported.
 */
bool EventLog::appendLine(const std::string &line)
{
    std::string data = line + '\n';
    std::string error;

    int fd = open(m_path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        error = strerror(errno);
    } else {
        size_t written = 0;
        while (written < data.length()) {
            ssize_t ret = write(fd, data.data() + written, data.length() - written);
            if (ret < 0) {
                if (errno == EINTR)
                    continue;
                error = strerror(errno);
                break;
            }
            written += ret;
        }

        if (error.empty() && fsync(fd) < 0)
            error = strerror(errno);
        if (close(fd) < 0 && error.empty())
            error = strerror(errno);
    }

    if (!error.empty()) {
        ++m_file_error_counter;
        std::stringstream ss;
        ss << "Failed to write event log " << m_path << ": " << error;
        if (m_file_error_counter == 1) {
            Logger::warn(ss.str());
        } else {
            ss << " (" << m_file_error_counter << " consecutive failures)";
            Logger::err(ss.str());
        }
        return false;
    }

    if (m_file_error_counter) {
        std::stringstream ss;
        ss << "Event log " << m_path << " writable again after "
           << m_file_error_counter << " failed writes";
        Logger::info(ss.str());
        m_file_error_counter = 0;
    }

    return true;
}

bool EventLog::printLine(const std::string &line)
{
    m_console << line << std::endl;
    if (!m_console) {
        m_console.clear();
        ++m_console_error_counter;
        std::stringstream ss;
        ss << "Failed to print event on console";
        if (m_console_error_counter == 1) {
            Logger::warn(ss.str());
        } else {
            ss << " (" << m_console_error_counter << " consecutive failures)";
            Logger::err(ss.str());
        }
        return false;
    }

    if (m_console_error_counter) {
        std::stringstream ss;
        ss << "Console output restored after " << m_console_error_counter << " failed writes";
        Logger::info(ss.str());
        m_console_error_counter = 0;
    }

    return true;
}
