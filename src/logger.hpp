#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

enum LogLevel {
    LOG_ERR,
    LOG_WARN,
    LOG_INFO,
    LOG_DEBUG,
};

class Logger {
public:
    Logger(const Logger &l) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(const Logger &l) = delete;
    Logger& operator=(Logger&&) = delete;

    static Logger& instance();

    static void err(const std::string &s);
    static void warn(const std::string &s);
    static void info(const std::string &s);
    static void debug(const std::string &s);

    /**
     * @brief Start writing log files in a directory
     *
     * Files are named log-<index>.txt. A new file is opened
     * once the current one grows too large and only the
     * most recent ones are kept.
     *
     * @param dir directory where log files are created
     */
    void startLogging(const std::string &dir);
    void stopLogging();

    /* Messages are printed on stderr. stdout carries presence events. */
    void setLevel(LogLevel level);

private:
    Logger();
    ~Logger() = default;
    void log(LogLevel level, const char *prefix, const std::string &s);

    std::string m_dir;
    unsigned long long m_index;
    std::ofstream m_file;
    LogLevel m_level;
    std::mutex m_mutex;
};

#endif
