#ifndef SENSORTONELOOP_HPP
#define SENSORTONELOOP_HPP

#include <atomic>
#include <cstdint>

#include "../common/Config.hpp"
#include "../common/CycleStats.hpp"
#include "../common/SensorData.hpp"
#include "../common/Ticker.hpp"
#include "../sensors/AnalogInput.hpp"
#include "../Buzzer/ToneOutput.hpp"
#include "../tone/ToneMapping.hpp"

// Samples the light sensor once per tick and plays the matching note.
// Owns the buzzer state; input and output must outlive the loop.
class SensorToneLoop {
public:
    SensorToneLoop(AnalogInput& input, ToneOutput& output,
                   const ToneMapping& mapping = ToneMapping{},
                   float duty = kDefaultDuty);

    // Current reading, clamped. A failed read counts as 0.
    SensorReading sample();
    int mapToTone(SensorReading reading) const { return mapping_.mapToTone(reading); }
    // 0 silences the buzzer
    void drive(int frequency);

    void step();

    // Runs until running is cleared or the ticker stops; returns cycles executed.
    uint64_t run(Ticker& ticker, const std::atomic<bool>& running);

    const BuzzerState& state() const { return state_; }
    const CycleStats& stats() const { return stats_; }
    SensorReading lastReading() const { return lastReading_; }
    uint64_t failedReads() const { return failedReads_; }

private:
    void reportStatus();

    AnalogInput& input_;
    ToneOutput& output_;
    ToneMapping mapping_;
    float duty_;

    BuzzerState state_;
    CycleStats stats_;
    SensorReading lastReading_ = 0;
    uint64_t failedReads_ = 0;
};

#endif // SENSORTONELOOP_HPP
