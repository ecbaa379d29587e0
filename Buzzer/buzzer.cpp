#include "buzzer.hpp"

#include <pigpio.h>
#include <iostream>
#include <sys/syslog.h>

static_assert(kPwmDutyRange == PI_HW_PWM_RANGE, "duty range must match pigpio");

PwmBuzzer::PwmBuzzer(unsigned gpio) : gpio_(gpio) {
    gpioHardwarePWM(gpio_, 0, 0);
    std::cout << "[Buzzer] PWM on GPIO " << gpio_ << "\n";
}

PwmBuzzer::~PwmBuzzer() {
    stop();
}

bool PwmBuzzer::start(int freq, float duty) {
    if (freq <= 0) {
        stop();
        return true;
    }

    int ret = gpioHardwarePWM(gpio_, static_cast<unsigned>(freq), dutyToPigpio(duty));
    if (ret != 0) {
        syslog(LOG_ERR, "gpioHardwarePWM(%u, %d) failed: %d", gpio_, freq, ret);
        return false;
    }
    return true;
}

void PwmBuzzer::stop() {
    gpioHardwarePWM(gpio_, 0, 0);
}
