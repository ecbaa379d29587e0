#ifndef FAKES_HPP
#define FAKES_HPP

#include <gmock/gmock.h>

#include <optional>
#include <utility>
#include <vector>

#include "../Buzzer/ToneOutput.hpp"
#include "../common/Ticker.hpp"
#include "../sensors/AnalogInput.hpp"

// Returns a fixed script of samples; std::nullopt is a failed read.
class ScriptedInput : public AnalogInput {
public:
    explicit ScriptedInput(std::vector<std::optional<int32_t>> script)
        : script_(std::move(script)) {}

    bool read(int32_t& raw) override {
        reads++;
        if (next_ >= script_.size() || !script_[next_]) {
            next_++;
            return false;
        }
        raw = *script_[next_++];
        return true;
    }

    int reads = 0;

private:
    std::vector<std::optional<int32_t>> script_;
    size_t next_ = 0;
};

class MockToneOutput : public ToneOutput {
public:
    MOCK_METHOD(bool, start, (int freq, float duty), (override));
    MOCK_METHOD(void, stop, (), (override));
};

// Records every call; frequency 0 marks a stop.
class RecordingOutput : public ToneOutput {
public:
    bool start(int freq, float duty) override {
        frequencies.push_back(freq);
        lastDuty = duty;
        return true;
    }
    void stop() override { frequencies.push_back(0); }

    std::vector<int> frequencies;
    float lastDuty = 0.0f;
};

// Delivers a fixed number of ticks, then reports the ticker as stopped.
class ManualTicker : public Ticker {
public:
    explicit ManualTicker(int ticks) : remaining_(ticks) {}

    bool wait() override {
        if (remaining_ <= 0) {
            return false;
        }
        remaining_--;
        delivered++;
        return true;
    }

    int delivered = 0;

private:
    int remaining_;
};

#endif // FAKES_HPP
