#include "SensorToneLoop.hpp"

#include <iomanip>
#include <iostream>
#include <sys/syslog.h>
#include <time.h>

SensorToneLoop::SensorToneLoop(AnalogInput& input, ToneOutput& output,
                               const ToneMapping& mapping, float duty)
    : input_(input), output_(output), mapping_(mapping), duty_(duty) {}

SensorReading SensorToneLoop::sample() {
    int32_t raw = 0;
    if (!input_.read(raw)) {
        failedReads_++;
        syslog(LOG_WARNING, "Analog read failed (%llu total), using 0 for this cycle",
               static_cast<unsigned long long>(failedReads_));
        return 0;
    }
    return clampReading(raw);
}

void SensorToneLoop::drive(int frequency) {
    if (frequency <= 0) {
        if (state_.active) {
            output_.stop();
        }
        state_ = BuzzerState{};
        return;
    }

    if (state_.active && state_.frequency_hz == frequency) {
        return;
    }

    if (!output_.start(frequency, duty_)) {
        // Previous tone may still be sounding; silence it and retry next cycle
        if (state_.active) {
            output_.stop();
        }
        state_ = BuzzerState{};
        return;
    }
    state_.active = true;
    state_.frequency_hz = frequency;
    state_.duty = duty_;
}

void SensorToneLoop::step() {
    timespec start{}, end{};
    clock_gettime(CLOCK_MONOTONIC, &start);

    lastReading_ = sample();
    drive(mapToTone(lastReading_));

    clock_gettime(CLOCK_MONOTONIC, &end);
    uint64_t exec_us = (end.tv_sec - start.tv_sec) * 1000000ULL +
                       (end.tv_nsec - start.tv_nsec) / 1000;
    stats_.update(exec_us);

    if (stats_.count % kStatusEveryCycles == 0) {
        reportStatus();
    }
}

uint64_t SensorToneLoop::run(Ticker& ticker, const std::atomic<bool>& running) {
    std::cout << "[Loop] Started\n";
    syslog(LOG_INFO, "Light loop started");

    uint64_t cycles = 0;
    while (running.load()) {
        if (!ticker.wait()) {
            break;
        }
        if (!running.load()) {
            break;
        }
        step();
        cycles++;
    }

    drive(0);
    std::cout << "[Loop] Stopped after " << cycles << " cycles\n";
    syslog(LOG_INFO, "Light loop stopped after %llu cycles (%llu failed reads)",
           static_cast<unsigned long long>(cycles),
           static_cast<unsigned long long>(failedReads_));
    return cycles;
}

void SensorToneLoop::reportStatus() {
    float norm = normalize(lastReading_, mapping_.calibration());

    std::cout << "[Loop] Raw: " << lastReading_
              << ", Norm: " << std::fixed << std::setprecision(3) << norm
              << ", Lux: " << std::setprecision(1) << estimateLux(norm)
              << ", Tone: " << state_.frequency_hz << " Hz" << std::endl;

    std::cout << "[Timing] Avg: " << std::setprecision(1) << stats_.averageUs()
              << " us, Min: " << stats_.min_us
              << " us, Max: " << stats_.max_us
              << " us, Jitter: " << stats_.jitterUs() << " us\n";
    std::cout.unsetf(std::ios::floatfield);
    std::cout.precision(6);
}
