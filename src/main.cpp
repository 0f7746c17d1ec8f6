#include <atomic>
#include <csignal>
#include <functional>
#include <iostream>
#include <memory>
#include <sstream>
#include "clock.hpp"
#include "config.hpp"
#include "event_log.hpp"
#include "logger.hpp"
#include "presence_engine.hpp"
#include "simulated_scan_source.hpp"
#include "version.hpp"
#ifdef HAVE_BLUEZ
#include "hci_scan_source.hpp"
#endif
#ifdef HAVE_MICROHTTPD
#include "web_server.hpp"
#endif

namespace {

std::atomic<bool> running(true);

void handle_signal(int sig)
{
    (void) sig;
    running = false;
}

void install_signal_handlers()
{
    struct sigaction sa;
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, NULL);
    sigaction(SIGTERM, &sa, NULL);
}

}

static void print_help(char *program_name)
{
    std::cout << "Usage: " << program_name << " [options]\n"
              << "Options:\n"
              << "    --config <path>                   Configuration file (required)\n"
              << "    --simulate                        Use simulated devices instead of the adapter\n"
              << "    --verbose                         Print debug messages\n"
              << "    --version, -v                     Print version\n"
              << "    --help, -h                        Print help\n"
              << std::flush;
}

int main(int argc, char **argv)
{
    char *program_name = argv[0];
    std::string config_path;
    bool simulate = false;
    bool verbose = false;

    argc--;
    argv++;
    while (argc) {
        std::string opt(argv[0]);
        if (opt == "--config" && argc >= 2) {
            config_path = argv[1];
            argc--;
            argv++;
        } else if (opt == "--simulate") {
            simulate = true;
        } else if (opt == "--verbose") {
            verbose = true;
        } else if (opt == "--help" || opt == "-h") {
            print_help(program_name);
            return 0;
        } else if (opt == "--version" || opt == "-v") {
            std::cout << get_version_str() << std::endl;
            return 0;
        } else {
            std::cerr << "Invalid option: \"" << opt << '\"' << std::endl;
            print_help(program_name);
            return -1;
        }

        argc--;
        argv++;
    }

    if (config_path.empty()) {
        std::cerr << "Missing --config option" << std::endl;
        print_help(program_name);
        return -1;
    }

    if (verbose)
        Logger::instance().setLevel(LOG_DEBUG);

    Config config;
    try {
        config = load_config(config_path);
    } catch (const ConfigError &e) {
        Logger::err(e.what());
        return -1;
    }

    if (!config.diag_log_dir.empty())
        Logger::instance().startLogging(config.diag_log_dir);

    {
        std::stringstream ss;
        ss << program_name << " (version: " << get_version_str() <<  ") started";
        Logger::info(ss.str());
    }

    SystemClock clock;
    std::unique_ptr<ScanSource> source;
    if (simulate) {
        source.reset(new SimulatedScanSource(clock, config.simulation_seed, config.simulation_failure_rate));
    } else {
#ifdef HAVE_BLUEZ
        source.reset(new HciScanSource(clock, config.adapter));
#else
        Logger::err("Built without BlueZ support, only --simulate is available");
        Logger::instance().stopLogging();
        return -1;
#endif
    }

    EventLog event_log(config.log_path);
    ObservationCallback observation_cb;
    if (config.log_observations)
        observation_cb = std::bind(&EventLog::logObservation, &event_log, std::placeholders::_1, std::placeholders::_2);

    PresenceEngine engine(config, *source, clock,
                          std::bind(&EventLog::publish, &event_log, std::placeholders::_1),
                          observation_cb);

#ifdef HAVE_MICROHTTPD
    std::unique_ptr<WebServer> web_server;
    if (config.web_port) {
        web_server.reset(new WebServer(&engine, config.web_port));
        try {
            web_server->start();
        } catch (const std::runtime_error &) {
            /* Presence detection does not depend on the status page */
            web_server.reset();
        }
    }
#else
    if (config.web_port)
        Logger::warn("Built without libmicrohttpd, web_port is ignored");
#endif

    install_signal_handlers();

    int ret = 0;
    try {
        engine.run(running);
    } catch (const std::runtime_error &e) {
        Logger::err(e.what());
        ret = -1;
    }

#ifdef HAVE_MICROHTTPD
    if (web_server)
        web_server->stop();
#endif

    Logger::info("Exiting");
    Logger::instance().stopLogging();

    return ret;
}
