#ifndef BUZZER_HPP
#define BUZZER_HPP

#include "ToneOutput.hpp"
#include "../common/Config.hpp"

// Piezo buzzer on a pigpio hardware PWM pin. gpioInitialise() must have
// succeeded before use.
class PwmBuzzer : public ToneOutput {
public:
    explicit PwmBuzzer(unsigned gpio);
    ~PwmBuzzer() override;

    PwmBuzzer(const PwmBuzzer&) = delete;
    PwmBuzzer& operator=(const PwmBuzzer&) = delete;

    bool start(int freq, float duty) override;
    void stop() override;

private:
    unsigned gpio_;
};

// pigpio expresses hardware PWM duty as 0..kPwmDutyRange
inline unsigned dutyToPigpio(float duty) {
    if (duty <= 0.0f) return 0;
    if (duty >= 1.0f) return kPwmDutyRange;
    return static_cast<unsigned>(duty * kPwmDutyRange);
}

#endif // BUZZER_HPP
