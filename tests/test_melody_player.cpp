#include <gtest/gtest.h>

#include <algorithm>
#include <numeric>

#include "Fakes.hpp"
#include "../playback/MelodyPlayer.hpp"

namespace {

struct RecordingDelay {
    std::vector<int>* waits;
    void operator()(int ms) const { waits->push_back(ms); }
};

int total(const std::vector<int>& waits) {
    return std::accumulate(waits.begin(), waits.end(), 0);
}

}  // namespace

TEST(MelodyPlayer, PlayToneStartsWaitsAndStops) {
    RecordingOutput output;
    std::vector<int> waits;
    MelodyPlayer player(output, RecordingDelay{&waits});

    EXPECT_TRUE(player.playTone(kNoteA4, 250, 0.3f));
    EXPECT_EQ(output.frequencies, (std::vector<int>{kNoteA4, 0}));
    EXPECT_FLOAT_EQ(output.lastDuty, 0.3f);
    EXPECT_EQ(total(waits), 250);
}

TEST(MelodyPlayer, NonPositiveFrequencyRests) {
    RecordingOutput output;
    std::vector<int> waits;
    MelodyPlayer player(output, RecordingDelay{&waits});

    EXPECT_TRUE(player.playTone(0, 100));
    EXPECT_EQ(output.frequencies, (std::vector<int>{0}));
    EXPECT_EQ(total(waits), 100);
}

TEST(MelodyPlayer, PlaysNotesInOrderWithGaps) {
    RecordingOutput output;
    std::vector<int> waits;
    MelodyPlayer player(output, RecordingDelay{&waits});

    std::vector<Note> notes = {{kNoteC4, 100}, {kNoteE4, 200}, {kNoteG4, 300}};
    EXPECT_EQ(player.playMelody(notes, 20), 3);

    EXPECT_EQ(output.frequencies,
              (std::vector<int>{kNoteC4, 0, kNoteE4, 0, kNoteG4, 0, 0}));
    EXPECT_EQ(total(waits), 100 + 200 + 300 + 3 * 20);
}

TEST(MelodyPlayer, CancelStopsPlaybackAndSilences) {
    RecordingOutput output;
    std::vector<int> waits;
    MelodyPlayer* self = nullptr;
    MelodyPlayer player(output, [&](int ms) {
        waits.push_back(ms);
        // Cancel partway through the second note
        if (total(waits) >= 150) {
            self->cancel();
        }
    });
    self = &player;

    std::vector<Note> notes = {{kNoteC4, 100}, {kNoteD4, 100}, {kNoteE4, 100}};
    EXPECT_EQ(player.playMelody(notes, 0), 1);
    EXPECT_TRUE(player.cancelled());
    ASSERT_FALSE(output.frequencies.empty());
    EXPECT_EQ(output.frequencies.back(), 0);
    EXPECT_EQ(std::count(output.frequencies.begin(), output.frequencies.end(), kNoteE4), 0);
}

TEST(MelodyPlayer, CancelBeforePlaybackPlaysNothing) {
    RecordingOutput output;
    std::vector<int> waits;
    MelodyPlayer player(output, RecordingDelay{&waits});

    player.cancel();
    EXPECT_EQ(player.playMelody(kTwinkleSong), 0);
    EXPECT_EQ(output.frequencies, (std::vector<int>{0}));
    EXPECT_TRUE(waits.empty());

    EXPECT_FALSE(player.playTone(kNoteB4, 50));
}

TEST(MelodyPlayer, ResetAllowsPlaybackAfterCancel) {
    RecordingOutput output;
    std::vector<int> waits;
    MelodyPlayer player(output, RecordingDelay{&waits});

    player.cancel();
    player.reset();
    EXPECT_TRUE(player.playTone(kNoteB4, 50));
    EXPECT_EQ(output.frequencies, (std::vector<int>{kNoteB4, 0}));
}

TEST(MelodyPlayer, RefusedToneAbortsMelody) {
    MockToneOutput output;
    EXPECT_CALL(output, start(kNoteC4, ::testing::_)).WillOnce(::testing::Return(false));
    EXPECT_CALL(output, stop()).Times(::testing::AtLeast(1));

    std::vector<int> waits;
    MelodyPlayer player(output, RecordingDelay{&waits});
    EXPECT_EQ(player.playMelody({{kNoteC4, 100}, {kNoteD4, 100}}), 0);
    EXPECT_TRUE(waits.empty());
}

TEST(MelodyPlayer, TwinkleSongShape) {
    ASSERT_EQ(kTwinkleSong.size(), 14u);
    EXPECT_EQ(kTwinkleSong.front().frequency_hz, kNoteC4);
    EXPECT_EQ(kTwinkleSong[6].duration_ms, 800);
    EXPECT_EQ(kTwinkleSong.back().duration_ms, 800);
}
