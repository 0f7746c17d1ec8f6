#ifndef WEB_SERVER_HPP
#define WEB_SERVER_HPP

#include <microhttpd.h>
#include <string>
#include "presence_engine.hpp"

/* Read-only status page listing the devices currently present */
class WebServer {
public:
    WebServer(PresenceEngine *engine, unsigned int port);
    ~WebServer();

    void start();
    void stop();

    std::string buildWebpage();

private:

    PresenceEngine *m_engine;
    unsigned int m_port;
    struct MHD_Daemon *m_daemon;
};

#endif
