#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <chrono>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string &what);
};

struct Config {
    Config();

    std::chrono::milliseconds scan_interval;
    std::chrono::milliseconds presence_timeout;
    std::chrono::milliseconds scan_timeout;
    std::vector<std::string> exclude_mac_prefixes;
    std::string log_path;

    int min_rssi;
    std::chrono::milliseconds weak_signal_timeout;
    int weak_signal_threshold;
    unsigned int confirm_scans;
    bool log_observations;

    std::string adapter;
    std::string diag_log_dir;
    unsigned int web_port;

    unsigned int simulation_seed;
    double simulation_failure_rate;
};

/**
 * @brief Load configuration from a key/value file
 *
 * Each line has the form "key = value". Empty lines and lines
 * starting with '#' are ignored. Every key can be overridden by
 * an environment variable named after the key in uppercase
 * (scan_interval -> SCAN_INTERVAL).
 *
 * @param path path of the configuration file
 * @return validated configuration
 * @throw ConfigError if the file cannot be read or a value is invalid
 */
Config load_config(const std::string &path);

/**
 * @brief Build a configuration from already parsed key/value pairs
 *
 * Keys missing from values keep their default.
 *
 * @throw ConfigError if a value is invalid
 */
Config parse_config(const std::map<std::string, std::string> &values);

#endif
