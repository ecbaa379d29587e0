#ifndef POSIXTIMERTICKER_HPP
#define POSIXTIMERTICKER_HPP

#include <csignal>
#include <ctime>

#include "../common/Ticker.hpp"

// CLOCK_MONOTONIC interval timer delivering a real-time signal that is
// consumed synchronously with sigwaitinfo(). The signal is blocked in the
// calling thread on construction.
class PosixTimerTicker : public Ticker {
public:
    PosixTimerTicker(int periodMs, int signo);
    ~PosixTimerTicker() override;

    PosixTimerTicker(const PosixTimerTicker&) = delete;
    PosixTimerTicker& operator=(const PosixTimerTicker&) = delete;

    // Creates and arms the timer. Returns false on failure.
    bool start();
    bool wait() override;

private:
    int periodMs_;
    int signo_;
    sigset_t mask_;
    timer_t timerid_{};
    bool armed_ = false;
};

#endif // POSIXTIMERTICKER_HPP
