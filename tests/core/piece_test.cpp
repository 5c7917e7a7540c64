/**
 * @file piece_test.cpp
 * @brief Tests for voice rendering and piece queries.
 */

#include "core/piece.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace moira {
namespace {

Voice makeVoice(const std::string& id, const std::string& scale_name, int8_t octave,
                Tick start) {
  Voice voice;
  voice.id = id;
  ScaleResult result = parseScaleName(scale_name);
  EXPECT_TRUE(result.ok()) << result.error;
  if (result.ok()) voice.scale = *result.scale;
  voice.octave = octave;
  voice.start = start;
  return voice;
}

TEST(VoiceTest, EmptyVoiceEndsAtStart) {
  Voice voice = makeVoice("v", "Cmaj", 4, 36);
  EXPECT_EQ(voice.endTick(), 36u);

  MidiTrack track;
  std::string error;
  EXPECT_TRUE(voice.render(100, track, error));
  EXPECT_TRUE(track.empty());
}

TEST(VoiceTest, RenderAdvancesThroughRests) {
  Voice voice = makeVoice("melody", "Cmaj", 4, 12);
  voice.notes = {{0, 24}, {std::nullopt, 24}, {2, 12}, {-1, 36}};

  MidiTrack track;
  std::string error;
  ASSERT_TRUE(voice.render(90, track, error)) << error;

  const auto& notes = track.notes();
  ASSERT_EQ(notes.size(), 3u);

  EXPECT_EQ(notes[0].start_tick, 12u);
  EXPECT_EQ(notes[0].duration, 24u);
  EXPECT_EQ(notes[0].note, 60);
  EXPECT_EQ(notes[0].velocity, 90);

  // The rest occupies 36..60.
  EXPECT_EQ(notes[1].start_tick, 60u);
  EXPECT_EQ(notes[1].note, 64);

  EXPECT_EQ(notes[2].start_tick, 72u);
  EXPECT_EQ(notes[2].duration, 36u);
  EXPECT_EQ(notes[2].note, 59);

  EXPECT_EQ(voice.endTick(), 108u);
  EXPECT_EQ(track.lastTick(), 108u);
}

TEST(VoiceTest, RenderUsesVoiceVelocity) {
  Voice voice = makeVoice("v", "Gmaj", 3, 0);
  voice.velocity = 64;
  voice.notes = {{0, 24}};

  MidiTrack track;
  std::string error;
  ASSERT_TRUE(voice.render(100, track, error));
  ASSERT_EQ(track.noteCount(), 1u);
  EXPECT_EQ(track.notes()[0].note, 55);
  EXPECT_EQ(track.notes()[0].velocity, 64);
}

TEST(VoiceTest, RenderFailsOutsideMidiRange) {
  Voice voice = makeVoice("high", "Cmaj", 9, 0);
  voice.notes = {{0, 24}, {7, 24}};

  MidiTrack track;
  std::string error;
  EXPECT_FALSE(voice.render(100, track, error));
  EXPECT_EQ(error, "Voice high: degree 7 at octave 9 is outside MIDI range");
}

TEST(VoiceTest, NamedNotesSkipRests) {
  Voice voice = makeVoice("v", "Ebharm", 4, 0);
  voice.notes = {{0, 24}, {std::nullopt, 24}, {5, 24}, {6, 24}};

  std::vector<std::string> names;
  for (const auto& note : voice.namedNotes()) names.push_back(note.toString());
  EXPECT_EQ(names, (std::vector<std::string>{"Eb4", "Cb5", "D5"}));
}

TEST(PieceTest, FindVoice) {
  Piece piece;
  piece.voices.push_back(makeVoice("bass", "Cmaj", 2, 0));
  piece.voices.push_back(makeVoice("lead", "Cmaj", 5, 0));

  const Voice* lead = piece.findVoice("lead");
  ASSERT_NE(lead, nullptr);
  EXPECT_EQ(lead->octave, 5);
  EXPECT_EQ(piece.findVoice("Lead"), nullptr);
}

TEST(PieceTest, EndTickIsLongestVoice) {
  Piece piece;
  EXPECT_EQ(piece.endTick(), 0u);

  Voice early = makeVoice("a", "Cmaj", 4, 0);
  early.notes = {{0, 96}};
  Voice late = makeVoice("b", "Cmaj", 4, 72);
  late.notes = {{0, 48}};
  piece.voices.push_back(early);
  piece.voices.push_back(late);

  EXPECT_EQ(piece.endTick(), 120u);
}

}  // namespace
}  // namespace moira
