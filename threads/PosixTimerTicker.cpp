#include "PosixTimerTicker.hpp"

#include <cerrno>
#include <cstring>
#include <pthread.h>
#include <sys/syslog.h>

PosixTimerTicker::PosixTimerTicker(int periodMs, int signo)
    : periodMs_(periodMs), signo_(signo) {
    sigemptyset(&mask_);
    sigaddset(&mask_, signo_);
    pthread_sigmask(SIG_BLOCK, &mask_, nullptr);
}

PosixTimerTicker::~PosixTimerTicker() {
    if (armed_) {
        timer_delete(timerid_);
    }
}

bool PosixTimerTicker::start() {
    struct sigevent sev{};
    sev.sigev_notify = SIGEV_SIGNAL;
    sev.sigev_signo = signo_;

    if (timer_create(CLOCK_MONOTONIC, &sev, &timerid_) != 0) {
        syslog(LOG_ERR, "timer_create failed: %s", strerror(errno));
        return false;
    }

    struct itimerspec its{};
    its.it_value.tv_sec = periodMs_ / 1000;
    its.it_value.tv_nsec = (periodMs_ % 1000) * 1000000L;
    its.it_interval = its.it_value;

    if (timer_settime(timerid_, 0, &its, nullptr) != 0) {
        syslog(LOG_ERR, "timer_settime failed: %s", strerror(errno));
        timer_delete(timerid_);
        return false;
    }

    armed_ = true;
    return true;
}

bool PosixTimerTicker::wait() {
    if (!armed_) {
        return false;
    }

    siginfo_t info;
    if (sigwaitinfo(&mask_, &info) == -1) {
        // SIGINT/SIGTERM handlers interrupt the wait; let the caller check its flag
        if (errno == EINTR) {
            return true;
        }
        syslog(LOG_ERR, "sigwaitinfo failed: %s", strerror(errno));
        return false;
    }
    return true;
}
