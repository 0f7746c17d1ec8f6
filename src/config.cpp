#include "config.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

#define DEFAULT_SCAN_INTERVAL           (10 * 1000)     /* in milliseconds */
#define DEFAULT_PRESENCE_TIMEOUT        (30 * 1000)     /* in milliseconds */
#define DEFAULT_LOG_PATH                "./bt_presence.log"
#define DEFAULT_MIN_RSSI                (-100)          /* in dBm */
#define DEFAULT_WEAK_SIGNAL_THRESHOLD   (-90)           /* in dBm */
#define DEFAULT_ADAPTER                 "hci0"

namespace {

const char *KNOWN_KEYS[] = {
    "scan_interval",
    "presence_timeout",
    "scan_timeout",
    "exclude_mac_prefixes",
    "log_path",
    "min_rssi_dBm",
    "weak_signal_timeout",
    "weak_signal_threshold_dBm",
    "confirm_scans",
    "log_observations",
    "adapter",
    "diag_log_dir",
    "web_port",
    "simulation_seed",
    "simulation_failure_rate",
};

std::string trim(const std::string &s)
{
    std::string t(s);
    t.erase(t.begin(), std::find_if(t.begin(), t.end(),
        [] (unsigned char c){ return !std::isspace(c); }));
    t.erase(std::find_if(t.rbegin(), t.rend(),
        [] (unsigned char c){ return !std::isspace(c); }).base(), t.end());
    return t;
}

std::string to_upper(const std::string &s)
{
    std::string u(s);
    for (auto &c : u)
        c = toupper(static_cast<unsigned char>(c));
    return u;
}

double parse_double(const std::string &key, const std::string &val)
{
    size_t pos = 0;
    double d;
    try {
        d = std::stod(val, &pos);
    } catch (const std::exception &) {
        throw ConfigError("Invalid number \"" + val + "\" for key " + key);
    }
    if (pos != val.length())
        throw ConfigError("Invalid number \"" + val + "\" for key " + key);

    return d;
}

int parse_int(const std::string &key, const std::string &val)
{
    size_t pos = 0;
    int i;
    try {
        i = std::stoi(val, &pos);
    } catch (const std::exception &) {
        throw ConfigError("Invalid integer \"" + val + "\" for key " + key);
    }
    if (pos != val.length())
        throw ConfigError("Invalid integer \"" + val + "\" for key " + key);

    return i;
}

unsigned int parse_unsigned(const std::string &key, const std::string &val)
{
    int i = parse_int(key, val);
    if (i < 0)
        throw ConfigError("Negative value \"" + val + "\" for key " + key);

    return static_cast<unsigned int>(i);
}

/* Durations are given in seconds and may have a fractional part. They are rounded to the millisecond. */
std::chrono::milliseconds parse_seconds(const std::string &key, const std::string &val)
{
    double secs = parse_double(key, val);
    if (!(secs > 0.))
        throw ConfigError("Duration " + key + " must be positive");

    double ms = std::round(secs * 1000.);
    if (ms < 1.)
        throw ConfigError("Duration " + key + " must be at least 1ms");
    if (ms > static_cast<double>(UINT_MAX))
        throw ConfigError("Duration " + key + " is too long");

    return std::chrono::milliseconds(static_cast<long long>(ms));
}

bool parse_bool(const std::string &key, const std::string &val)
{
    std::string v = to_upper(val);
    if (v == "1" || v == "TRUE" || v == "YES" || v == "ON")
        return true;
    if (v == "0" || v == "FALSE" || v == "NO" || v == "OFF")
        return false;

    throw ConfigError("Invalid boolean \"" + val + "\" for key " + key);
}

std::vector<std::string> parse_list(const std::string &val)
{
    std::vector<std::string> items;
    std::istringstream iss(val);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = trim(item);
        if (!item.empty())
            items.push_back(item);
    }

    return items;
}

void apply_env_overrides(std::map<std::string, std::string> &values)
{
    for (auto key : KNOWN_KEYS) {
        const char *env = getenv(to_upper(key).c_str());
        if (!env)
            continue;

        std::stringstream ss;
        ss << "Overriding " << key << " from environment";
        Logger::debug(ss.str());
        values[key] = trim(env);
    }
}

}

ConfigError::ConfigError(const std::string &what):
std::runtime_error(what)
{
}

Config::Config():
scan_interval(DEFAULT_SCAN_INTERVAL),
presence_timeout(DEFAULT_PRESENCE_TIMEOUT),
scan_timeout(DEFAULT_SCAN_INTERVAL * 8 / 10),
exclude_mac_prefixes(),
log_path(DEFAULT_LOG_PATH),
min_rssi(DEFAULT_MIN_RSSI),
weak_signal_timeout(DEFAULT_PRESENCE_TIMEOUT),
weak_signal_threshold(DEFAULT_WEAK_SIGNAL_THRESHOLD),
confirm_scans(1),
log_observations(false),
adapter(DEFAULT_ADAPTER),
diag_log_dir(),
web_port(0),
simulation_seed(0),
simulation_failure_rate(0.)
{
}

Config parse_config(const std::map<std::string, std::string> &values)
{
    Config config;
    bool has_scan_timeout = false;
    bool has_weak_signal_timeout = false;

    for (auto &e : values) {
        const std::string &key = e.first;
        const std::string &val = e.second;

        if (key == "scan_interval") {
            config.scan_interval = parse_seconds(key, val);
        } else if (key == "presence_timeout") {
            config.presence_timeout = parse_seconds(key, val);
        } else if (key == "scan_timeout") {
            config.scan_timeout = parse_seconds(key, val);
            has_scan_timeout = true;
        } else if (key == "exclude_mac_prefixes") {
            config.exclude_mac_prefixes = parse_list(val);
        } else if (key == "log_path") {
            if (val.empty())
                throw ConfigError("log_path cannot be empty");
            config.log_path = val;
        } else if (key == "min_rssi_dBm") {
            config.min_rssi = parse_int(key, val);
        } else if (key == "weak_signal_timeout") {
            config.weak_signal_timeout = parse_seconds(key, val);
            has_weak_signal_timeout = true;
        } else if (key == "weak_signal_threshold_dBm") {
            config.weak_signal_threshold = parse_int(key, val);
        } else if (key == "confirm_scans") {
            config.confirm_scans = parse_unsigned(key, val);
            if (config.confirm_scans == 0)
                throw ConfigError("confirm_scans must be at least 1");
        } else if (key == "log_observations") {
            config.log_observations = parse_bool(key, val);
        } else if (key == "adapter") {
            config.adapter = val;
        } else if (key == "diag_log_dir") {
            config.diag_log_dir = val;
        } else if (key == "web_port") {
            config.web_port = parse_unsigned(key, val);
            if (config.web_port > 65535)
                throw ConfigError("web_port must be a valid TCP port");
        } else if (key == "simulation_seed") {
            config.simulation_seed = parse_unsigned(key, val);
        } else if (key == "simulation_failure_rate") {
            config.simulation_failure_rate = parse_double(key, val);
            if (config.simulation_failure_rate < 0. || config.simulation_failure_rate > 1.)
                throw ConfigError("simulation_failure_rate must be between 0 and 1");
        } else {
            std::stringstream ss;
            ss << "Invalid key \"" << key << '\"';
            Logger::warn(ss.str());
        }
    }

    if (!has_scan_timeout) {
        config.scan_timeout = config.scan_interval * 8 / 10;
        if (config.scan_timeout.count() == 0)
            throw ConfigError("scan_interval is too short");
    }
    if (!has_weak_signal_timeout)
        config.weak_signal_timeout = config.presence_timeout;

    if (config.scan_timeout >= config.scan_interval)
        throw ConfigError("scan_timeout must be shorter than scan_interval");

    if (config.presence_timeout <= config.scan_interval) {
        std::stringstream ss;
        ss << "presence_timeout (" << config.presence_timeout.count() << "ms) does not exceed"
           << " scan_interval (" << config.scan_interval.count() << "ms)."
           << " Devices will flap between NEW and LOST.";
        Logger::warn(ss.str());
    }

    return config;
}

Config load_config(const std::string &path)
{
    std::ifstream file(path);
    if (!file)
        throw ConfigError("Could not load configuration from file " + path);

    std::map<std::string, std::string> values;
    std::string line;
    unsigned int lineno = 0;
    while (std::getline(file, line)) {
        ++lineno;
        line = trim(line);
        if (line.empty() || line[0] == '#')
            continue;

        size_t ret = line.find('=');
        if (ret == std::string::npos) {
            std::stringstream ss;
            ss << path << ':' << lineno << ": ignoring line without '='";
            Logger::warn(ss.str());
            continue;
        }

        values[trim(line.substr(0, ret))] = trim(line.substr(ret + 1));
    }

    apply_env_overrides(values);

    Config config = parse_config(values);

    Logger::debug("Loaded configuration from file " + path);

    return config;
}
