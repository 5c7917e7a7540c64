/**
 * @file chord_test.cpp
 * @brief Tests for diatonic chord construction and naming.
 */

#include "core/chord.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace moira {
namespace {

Scale scaleNamed(const std::string& name) {
  ScaleResult result = parseScaleName(name);
  EXPECT_TRUE(result.ok()) << result.error;
  return result.ok() ? *result.scale : Scale();
}

std::vector<std::string> symbols(const std::vector<Chord>& chords,
                                 AccidentalStyle style = AccidentalStyle::Ascii) {
  std::vector<std::string> result;
  for (const auto& chord : chords) result.push_back(chord.symbol(style));
  return result;
}

std::vector<std::string> numerals(const std::vector<Chord>& chords) {
  std::vector<std::string> result;
  for (const auto& chord : chords) result.push_back(chord.romanNumeral());
  return result;
}

TEST(ChordQualityTest, FromIntervals) {
  EXPECT_EQ(qualityFromIntervals({4, 7}), ChordQuality::Major);
  EXPECT_EQ(qualityFromIntervals({3, 6, 9}), ChordQuality::Diminished7);
  EXPECT_EQ(qualityFromIntervals({3, 7, 11}), ChordQuality::MinorMajor7);
  EXPECT_FALSE(qualityFromIntervals({2, 7}).has_value());
  EXPECT_FALSE(qualityFromIntervals({}).has_value());
}

TEST(ChordQualityTest, Names) {
  EXPECT_STREQ(chordQualityName(ChordQuality::HalfDiminished7), "Half-diminished seventh");
  EXPECT_STREQ(chordQualityName(ChordQuality::Major), "Major");
}

TEST(ChordTest, CMajorTriads) {
  std::string error;
  auto chords = diatonicChords(scaleNamed("Cmaj"), 4, ChordSize::Triad, &error);
  ASSERT_EQ(chords.size(), 7u) << error;

  EXPECT_EQ(symbols(chords),
            (std::vector<std::string>{"C", "Dm", "Em", "F", "G", "Am", "Bdim"}));
  EXPECT_EQ(numerals(chords),
            (std::vector<std::string>{"I", "ii", "iii", "IV", "V", "vi", "viidim"}));
}

TEST(ChordTest, CMajorSevenths) {
  auto chords = diatonicChords(scaleNamed("Cmaj"), 4, ChordSize::Seventh);
  ASSERT_EQ(chords.size(), 7u);

  EXPECT_EQ(symbols(chords), (std::vector<std::string>{"Cmaj7", "Dm7", "Em7", "Fmaj7", "G7",
                                                       "Am7", "Bm7b5"}));
  EXPECT_EQ(numerals(chords), (std::vector<std::string>{"Imaj7", "ii7", "iii7", "IVmaj7", "V7",
                                                        "vi7", "viim7b5"}));
}

TEST(ChordTest, HarmonicMinorQualities) {
  auto triads = diatonicChords(scaleNamed("Aharm"), 3, ChordSize::Triad);
  ASSERT_EQ(triads.size(), 7u);
  EXPECT_EQ(triads[2].quality(), ChordQuality::Augmented);
  EXPECT_EQ(triads[2].romanNumeral(), "III+");
  EXPECT_EQ(triads[4].symbol(), "E");

  auto sevenths = diatonicChords(scaleNamed("Aharm"), 3, ChordSize::Seventh);
  ASSERT_EQ(sevenths.size(), 7u);
  EXPECT_EQ(sevenths[0].quality(), ChordQuality::MinorMajor7);
  EXPECT_EQ(sevenths[0].symbol(), "AmM7");
  EXPECT_EQ(sevenths[2].quality(), ChordQuality::AugmentedMajor7);
  EXPECT_EQ(sevenths[6].quality(), ChordQuality::Diminished7);
  EXPECT_EQ(sevenths[6].symbol(), "G#dim7");
}

TEST(ChordTest, NotesAreSpelledFromTheScale) {
  ChordResult result = buildChord(scaleNamed("Ebharm"), 4, 4, ChordSize::Seventh);
  ASSERT_TRUE(result.ok()) << result.error;
  const Chord& chord = *result.chord;

  std::vector<std::string> names;
  for (const auto& note : chord.notes()) names.push_back(note.toString());
  EXPECT_EQ(names, (std::vector<std::string>{"Bb4", "D5", "F5", "Ab5"}));
  EXPECT_EQ(chord.quality(), ChordQuality::Dominant7);
  EXPECT_EQ(chord.root().toString(), "Bb");
  EXPECT_EQ(chord.degree(), 4);
  EXPECT_EQ(chord.midiNotes(), (std::vector<uint8_t>{70, 74, 77, 80}));
}

TEST(ChordTest, UnicodeSymbols) {
  auto chords = diatonicChords(scaleNamed("Bbmaj"), 4, ChordSize::Seventh);
  ASSERT_EQ(chords.size(), 7u);
  EXPECT_EQ(chords[0].symbol(AccidentalStyle::Unicode), "B\xE2\x99\xAD" "maj7");
  EXPECT_EQ(chords[6].symbol(AccidentalStyle::Unicode), "A\xC3\xB8" "7");
  EXPECT_EQ(chords[6].romanNumeral(AccidentalStyle::Unicode), "vii\xC3\xB8" "7");

  auto triads = diatonicChords(scaleNamed("Cmaj"), 4, ChordSize::Triad);
  ASSERT_EQ(triads.size(), 7u);
  EXPECT_EQ(triads[6].symbol(AccidentalStyle::Unicode), "B\xC2\xB0");

  auto minor = diatonicChords(scaleNamed("Aharm"), 3, ChordSize::Seventh);
  ASSERT_EQ(minor.size(), 7u);
  EXPECT_EQ(minor[6].symbol(AccidentalStyle::Unicode), "G#\xC2\xB0" "7");
  EXPECT_EQ(minor[6].romanNumeral(AccidentalStyle::Unicode), "vii\xC2\xB0" "7");
}

TEST(ChordTest, RequiresSevenDegrees) {
  std::string error;
  auto chords = diatonicChords(scaleNamed("Cpent"), 4, ChordSize::Triad, &error);
  EXPECT_TRUE(chords.empty());
  EXPECT_EQ(error, "Chords need a seven-degree scale, Cpent has 5");
}

TEST(ChordTest, OutOfMidiRange) {
  ChordResult result = buildChord(scaleNamed("Cmaj"), 4, 9, ChordSize::Triad);
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.error, "Chord on degree 4 of Cmaj leaves MIDI range");
}

}  // namespace
}  // namespace moira
