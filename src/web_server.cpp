#include <cstdlib>
#include <cstring>
#include <ctime>
#include <microhttpd.h>
#include <stdexcept>
#include <sstream>
#include <sys/sysinfo.h>
#include "event_log.hpp"
#include "logger.hpp"
#include "version.hpp"
#include "web_server.hpp"

#if MHD_VERSION >= 0x00097002
typedef enum MHD_Result MHDResult;
#else
typedef int MHDResult;
#endif

namespace {

std::string get_uptime_str()
{
    struct sysinfo s_info;
    int ret = sysinfo(&s_info);
    if (ret)
        return "unknown";

    unsigned int secs = s_info.uptime;
    unsigned int days = secs / (60 * 60 * 24);
    secs -= days * (60 * 60 * 24);
    unsigned int hours = secs / (60 * 60);
    secs -= hours * (60 * 60);
    unsigned int minutes = secs / 60;
    secs -= minutes * 60;

    std::stringstream ss;
    ss << days << " days " << hours << "h " << minutes << "m " << secs << "s";
    return ss.str();
}

std::string html_escape(const std::string &s)
{
    std::string out;
    for (auto c : s) {
        switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        default: out += c; break;
        }
    }
    return out;
}

MHDResult answerConnection(void *cls, struct MHD_Connection *connection,
                           const char *url, const char *method,
                           const char *version, const char *upload_data,
                           size_t *upload_data_size, void **con_cls)
{
    struct MHD_Response *response;
    MHDResult ret;
    WebServer *server = reinterpret_cast<WebServer*>(cls);
    (void) url;               /* Unused. Silent compiler warning. */
    (void) version;           /* Unused. Silent compiler warning. */
    (void) upload_data;       /* Unused. Silent compiler warning. */
    (void) upload_data_size;  /* Unused. Silent compiler warning. */
    (void) con_cls;           /* Unused. Silent compiler warning. */

    if (strcmp(method, MHD_HTTP_METHOD_GET) != 0)
        return MHD_NO;

    std::string page = server->buildWebpage();

    char *buf = (char *)malloc(page.length() + 1);
    if (!buf)
        return MHD_NO;
    strcpy(buf, page.c_str());
    response = MHD_create_response_from_buffer(page.length(), buf, MHD_RESPMEM_MUST_FREE);
    MHD_add_response_header(response, MHD_HTTP_HEADER_CONTENT_TYPE, "text/html; charset=utf-8");
    ret = MHD_queue_response(connection, MHD_HTTP_OK, response);
    MHD_destroy_response(response);

    return ret;
}

}

WebServer::WebServer(PresenceEngine *engine, unsigned int port):
m_engine(engine),
m_port(port),
m_daemon(nullptr)
{

}

WebServer::~WebServer()
{
    if (m_daemon)
        stop();
}

void WebServer::start()
{
    if (m_daemon) {
        Logger::warn("Attempted to start already running web server");
        return;
    }

    m_daemon = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD,
                               m_port, NULL, NULL,
                               &answerConnection, this, MHD_OPTION_END);

    if (!m_daemon) {
        Logger::err("Failed to start web server");
        throw std::runtime_error("Failed to start web server");
    } else {
        std::stringstream ss;
        ss << "Web server started. Listening on port " << m_port;
        Logger::info(ss.str());
    }
}

void WebServer::stop()
{
    if (m_daemon) {
        MHD_stop_daemon(m_daemon);
        m_daemon = nullptr;
        Logger::info("Web server stopped");
    } else {
        Logger::warn("Attempted to stop already stopped web server");
    }
}

/*
 * Beware this function is called from the web server thread !
 * Only the status copy published by the engine may be used.
 */
std::string WebServer::buildWebpage()
{
    PresenceStatus status = m_engine->getStatus();
    auto now = std::chrono::steady_clock::now();

    std::stringstream ss;

    ss << "<html><head>\
        <style>\
        table, td, th {\
        border: 1px solid black;\
        }\
        table {\
        width: 100%;\
        border-collapse: collapse;\
        }\
        </style>\
        <title>Bluetooth presence</title>\
        </head><body>";

    ss << "<h1>Bluetooth presence</h1>";
    ss << "<h2>Service information</h2>";
    ss << "Software version: " << get_version_str();
    ss << "<br>";
    ss << "Uptime: " << get_uptime_str();
    ss << "<br>";
    ss << "Scan cycles: " << status.cycle_count;
    ss << "<br>";
    if (status.cycle_count)
        ss << "Last cycle: " << format_timestamp(status.last_cycle_time);
    ss << "<br>";
    ss << "Scan status: ";
    if (status.scan_error_counter)
        ss << "<span style=\"color:red\">failing for " << status.scan_error_counter << " cycle(s)</span>";
    else
        ss << "OK";

    ss << "<h2>Present devices (" << status.devices.size() << ")</h2>";
    ss << "<table>";
    ss << "<tr>";
    ss << "<th>Name</th>";
    ss << "<th>MAC address</th>";
    ss << "<th>RSSI (dBm)</th>";
    ss << "<th>Present for</th>";
    ss << "<th>Last seen</th>";
    ss << "</tr>";

    for (auto &d : status.devices) {
        auto present_for = std::chrono::duration_cast<std::chrono::seconds>(now - d.first_seen_at).count();
        auto last_seen = std::chrono::duration_cast<std::chrono::seconds>(now - d.last_seen_at).count();

        ss << "<tr>";
        if (!d.name.empty())
            ss << "<td>" << html_escape(d.name) << "</td>";
        else
            ss << "<td>N/A</td>";
        ss << "<td>" << d.mac << "</td>";
        ss << "<td>" << d.rssi << "</td>";
        ss << "<td>" << present_for << "s</td>";
        ss << "<td>" << last_seen << "s ago</td>";
        ss << "</tr>";
    }

    ss << "</table>";

    ss << "</body></html>";

    return ss.str();
}
