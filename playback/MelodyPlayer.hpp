#ifndef MELODYPLAYER_HPP
#define MELODYPLAYER_HPP

#include <atomic>
#include <functional>
#include <vector>

#include "../Buzzer/ToneOutput.hpp"
#include "../common/Config.hpp"
#include "../common/SensorData.hpp"

// Blocking delay in milliseconds
using DelayFn = std::function<void(int)>;

void sleepMs(int ms);

// "Twinkle, Twinkle, Little Star"
extern const std::vector<Note> kTwinkleSong;

class MelodyPlayer {
public:
    explicit MelodyPlayer(ToneOutput& output, DelayFn delay = sleepMs);

    // Plays one tone for ms. freq <= 0 rests for ms. Returns false if
    // cancelled or the output refused the tone.
    bool playTone(int freq, int ms = kDefaultToneMs, float duty = kDefaultDuty);

    // Returns the number of notes played before completion or cancel.
    int playMelody(const std::vector<Note>& notes, int gapMs = kDefaultGapMs,
                   float duty = kDefaultDuty);

    // Safe to call from a signal handler. Stays in effect until reset().
    void cancel() { cancelled_.store(true); }
    void reset() { cancelled_.store(false); }
    bool cancelled() const { return cancelled_.load(); }

private:
    bool waitMs(int ms);
    bool playNote(const Note& note, float duty);

    ToneOutput& output_;
    DelayFn delay_;
    std::atomic<bool> cancelled_{false};
};

#endif // MELODYPLAYER_HPP
