#include "MelodyPlayer.hpp"

#include <algorithm>
#include <iostream>
#include <sys/syslog.h>
#include <unistd.h>
#include <utility>

// Longest uninterrupted wait, so cancel() takes effect quickly
#define WAIT_SLICE_MS 10

const std::vector<Note> kTwinkleSong = {
    {kNoteC4, 400}, {kNoteC4, 400}, {kNoteG4, 400}, {kNoteG4, 400},
    {kNoteA4, 400}, {kNoteA4, 400}, {kNoteG4, 800},
    {kNoteF4, 400}, {kNoteF4, 400}, {kNoteE4, 400}, {kNoteE4, 400},
    {kNoteD4, 400}, {kNoteD4, 400}, {kNoteC4, 800},
};

void sleepMs(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

MelodyPlayer::MelodyPlayer(ToneOutput& output, DelayFn delay)
    : output_(output), delay_(std::move(delay)) {}

bool MelodyPlayer::waitMs(int ms) {
    while (ms > 0) {
        if (cancelled_.load()) {
            return false;
        }
        int slice = std::min(ms, WAIT_SLICE_MS);
        delay_(slice);
        ms -= slice;
    }
    return !cancelled_.load();
}

bool MelodyPlayer::playNote(const Note& note, float duty) {
    if (note.frequency_hz > 0 && !output_.start(note.frequency_hz, duty)) {
        output_.stop();
        return false;
    }
    bool completed = waitMs(note.duration_ms);
    output_.stop();
    return completed;
}

bool MelodyPlayer::playTone(int freq, int ms, float duty) {
    if (cancelled_.load()) {
        return false;
    }
    return playNote(Note{freq, ms}, duty);
}

int MelodyPlayer::playMelody(const std::vector<Note>& notes, int gapMs, float duty) {
    std::cout << "[Melody] Playing " << notes.size() << " notes, gap " << gapMs << " ms\n";

    int played = 0;
    for (const Note& note : notes) {
        if (cancelled_.load() || !playNote(note, duty)) {
            break;
        }
        played++;
        if (!waitMs(gapMs)) {
            break;
        }
    }

    output_.stop();
    if (played < static_cast<int>(notes.size())) {
        syslog(LOG_INFO, "Melody stopped after %d of %zu notes", played, notes.size());
    }
    return played;
}
