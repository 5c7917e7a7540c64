#include <gtest/gtest.h>
#include "core/midi_track.h"

namespace moira {
namespace {

TEST(MidiTrackTest, EmptyTrack) {
  MidiTrack track;
  EXPECT_TRUE(track.empty());
  EXPECT_EQ(track.noteCount(), 0u);
  EXPECT_EQ(track.lastTick(), 0u);
}

TEST(MidiTrackTest, AddNote) {
  MidiTrack track;
  track.addNote(0, TICKS_PER_BEAT, 60, 100);

  EXPECT_FALSE(track.empty());
  EXPECT_EQ(track.noteCount(), 1u);
  EXPECT_EQ(track.lastTick(), TICKS_PER_BEAT);

  const auto& notes = track.notes();
  EXPECT_EQ(notes[0].start_tick, 0u);
  EXPECT_EQ(notes[0].duration, TICKS_PER_BEAT);
  EXPECT_EQ(notes[0].note, 60);
  EXPECT_EQ(notes[0].velocity, 100);
}

TEST(MidiTrackTest, LastTickIsLatestEnd) {
  MidiTrack track;
  track.addNote(0, 96, 60, 100);
  track.addNote(24, 12, 64, 100);
  EXPECT_EQ(track.lastTick(), 96u);
}

TEST(MidiTrackTest, Transpose) {
  MidiTrack track;
  track.addNote(0, 24, 60, 100);
  track.addNote(24, 24, 64, 100);

  EXPECT_EQ(track.transpose(2), 0u);

  const auto& notes = track.notes();
  EXPECT_EQ(notes[0].note, 62);
  EXPECT_EQ(notes[1].note, 66);
}

TEST(MidiTrackTest, TransposeClampHigh) {
  MidiTrack track;
  track.addNote(0, 24, 126, 100);
  track.addNote(24, 24, 100, 100);

  EXPECT_EQ(track.transpose(5), 1u);

  const auto& notes = track.notes();
  EXPECT_EQ(notes[0].note, 127);  // Clamped to max
  EXPECT_EQ(notes[1].note, 105);
}

TEST(MidiTrackTest, TransposeClampLow) {
  MidiTrack track;
  track.addNote(0, 24, 2, 100);

  EXPECT_EQ(track.transpose(-5), 1u);
  EXPECT_EQ(track.notes()[0].note, 0);  // Clamped to min
}

TEST(MidiTrackTest, Clear) {
  MidiTrack track;
  track.addNote(NoteEvent(0, 24, 60, 100));
  EXPECT_FALSE(track.empty());

  track.clear();

  EXPECT_TRUE(track.empty());
  EXPECT_EQ(track.noteCount(), 0u);
}

TEST(MidiTrackTest, ToMidiEvents) {
  MidiTrack track;
  track.addNote(0, 24, 60, 100);

  auto events = track.toMidiEvents(1);

  ASSERT_EQ(events.size(), 2u);

  // Note on
  EXPECT_EQ(events[0].tick, 0u);
  EXPECT_EQ(events[0].status, 0x91);  // Note on, channel 1
  EXPECT_EQ(events[0].data1, 60);
  EXPECT_EQ(events[0].data2, 100);

  // Note off
  EXPECT_EQ(events[1].tick, 24u);
  EXPECT_EQ(events[1].status, 0x81);  // Note off, channel 1
  EXPECT_EQ(events[1].data1, 60);
  EXPECT_EQ(events[1].data2, 0);
}

TEST(MidiTrackTest, ToMidiEventsSorted) {
  MidiTrack track;
  track.addNote(48, 24, 67, 100);
  track.addNote(0, 24, 60, 100);
  track.addNote(24, 24, 64, 100);

  auto events = track.toMidiEvents(0);
  ASSERT_EQ(events.size(), 6u);

  EXPECT_EQ(events[0].tick, 0u);
  EXPECT_EQ(events[1].tick, 24u);
  EXPECT_EQ(events[2].tick, 24u);
  EXPECT_EQ(events[3].tick, 48u);
  EXPECT_EQ(events[4].tick, 48u);
  EXPECT_EQ(events[5].tick, 72u);
}

TEST(MidiTrackTest, NoteOffBeforeNoteOnAtSameTick) {
  // Repeated pitch: the first note must be closed before the second starts.
  MidiTrack track;
  track.addNote(0, 24, 60, 100);
  track.addNote(24, 24, 60, 100);

  auto events = track.toMidiEvents(0);
  ASSERT_EQ(events.size(), 4u);
  EXPECT_EQ(events[1].tick, 24u);
  EXPECT_EQ(events[1].status, 0x80);
  EXPECT_EQ(events[2].tick, 24u);
  EXPECT_EQ(events[2].status, 0x90);
}

TEST(MidiTrackTest, AnalyzeRangeEmpty) {
  MidiTrack track;
  auto [low, high] = track.analyzeRange();

  // Empty track returns invalid range (127, 0)
  EXPECT_EQ(low, 127);
  EXPECT_EQ(high, 0);
}

TEST(MidiTrackTest, AnalyzeRange) {
  MidiTrack track;
  track.addNote(0, 24, 64, 100);
  track.addNote(24, 24, 57, 100);
  track.addNote(48, 24, 76, 100);

  auto [low, high] = track.analyzeRange();

  EXPECT_EQ(low, 57);
  EXPECT_EQ(high, 76);
}

}  // namespace
}  // namespace moira
