#include "timer.hpp"
#include <cerrno>
#include <poll.h>
#include <stdexcept>
#include <sys/timerfd.h>
#include <unistd.h>

Timer::Timer():
fd(-1)
{
}

Timer::~Timer()
{
    if (fd >= 0)
        close(fd);
}

void Timer::start(unsigned int period_ms, bool periodic)
{
    if (fd < 0) {
        fd = timerfd_create(CLOCK_MONOTONIC, 0);
        if (fd < 0)
            throw std::runtime_error("Failed to create timer");
    }

    struct itimerspec val;
    val.it_value.tv_sec = period_ms / 1000;
    val.it_value.tv_nsec = (period_ms - val.it_value.tv_sec  * 1000) * 1000 * 1000;
    val.it_interval.tv_sec = 0;
    val.it_interval.tv_nsec = 0;
    if (periodic) {
        val.it_interval.tv_nsec = val.it_value.tv_nsec;
        val.it_interval.tv_sec = val.it_value.tv_sec;
    }
    if (timerfd_settime(fd, 0, &val, NULL) < 0)
        throw std::runtime_error("Failed to arm timer");
}

void Timer::stop()
{
    if (fd < 0)
        return;

    struct itimerspec val;
    val.it_interval.tv_nsec = 0;
    val.it_interval.tv_sec = 0;
    val.it_value.tv_nsec = 0;
    val.it_value.tv_sec = 0;
    timerfd_settime(fd, 0, &val, NULL);
}

uint64_t Timer::wait(int timeout_ms)
{
    if (fd < 0)
        return 0;

    struct pollfd fds[1];
    fds[0].fd = fd;
    fds[0].events = POLLIN;

    int ret = poll(fds, sizeof(fds)/sizeof(fds[0]), timeout_ms);
    if (ret <= 0)
        return 0;

    uint64_t expirations = 0;
    if (read(fd, &expirations, sizeof(expirations)) != sizeof(expirations))
        return 0;

    return expirations;
}
