#ifndef TIMER_HPP
#define TIMER_HPP

#include <cstdint>

class Timer {
public:
    Timer();
    virtual ~Timer();

    Timer(const Timer &t) = delete;
    Timer& operator=(const Timer &t) = delete;

    void start(unsigned int period_ms, bool periodic = false);
    void stop();

    /**
     * @brief Wait for the timer to expire
     *
     * @param timeout_ms maximum time to wait
     * @return number of expirations since the last call, 0 on timeout
     */
    uint64_t wait(int timeout_ms);

private:
    int fd;
};

#endif
