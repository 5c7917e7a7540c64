/**
 * @file key_test.cpp
 * @brief Tests for pitch classes, notes and their spellings.
 */

#include "core/key.h"

#include <gtest/gtest.h>

#include <sstream>

namespace moira {
namespace {

// ============================================================================
// Letters and accidentals
// ============================================================================

TEST(LetterTest, PitchClassesOfNaturals) {
  EXPECT_EQ(letterPitchClass(Letter::C), 0);
  EXPECT_EQ(letterPitchClass(Letter::D), 2);
  EXPECT_EQ(letterPitchClass(Letter::E), 4);
  EXPECT_EQ(letterPitchClass(Letter::F), 5);
  EXPECT_EQ(letterPitchClass(Letter::G), 7);
  EXPECT_EQ(letterPitchClass(Letter::A), 9);
  EXPECT_EQ(letterPitchClass(Letter::B), 11);
}

TEST(LetterTest, LettersFromWrapsAround) {
  auto letters = lettersFrom(Letter::A);
  EXPECT_EQ(letters[0], Letter::A);
  EXPECT_EQ(letters[1], Letter::B);
  EXPECT_EQ(letters[2], Letter::C);
  EXPECT_EQ(letters[6], Letter::G);
}

TEST(AccidentalTest, AsciiAndUnicodeSymbols) {
  EXPECT_STREQ(accidentalSymbol(Accidental::Flat, AccidentalStyle::Ascii), "b");
  EXPECT_STREQ(accidentalSymbol(Accidental::Sharp, AccidentalStyle::Ascii), "#");
  EXPECT_STREQ(accidentalSymbol(Accidental::DoubleSharp, AccidentalStyle::Ascii), "x");
  EXPECT_STREQ(accidentalSymbol(Accidental::Natural, AccidentalStyle::Unicode), "");
  EXPECT_STREQ(accidentalSymbol(Accidental::Flat, AccidentalStyle::Unicode), "\xE2\x99\xAD");
  EXPECT_STREQ(accidentalSymbol(Accidental::DoubleSharp, AccidentalStyle::Unicode),
               "\xF0\x9D\x84\xAA");
}

// ============================================================================
// PitchClass
// ============================================================================

TEST(PitchClassTest, ConstructionWrapsModulo12) {
  EXPECT_EQ(PitchClass(12).value(), 0);
  EXPECT_EQ(PitchClass(-1).value(), 11);
  EXPECT_EQ(PitchClass(-13).value(), 11);
  EXPECT_EQ((PitchClass(10) + 5).value(), 3);
}

TEST(PitchClassTest, SpellWithLetter) {
  PitchClass d_sharp(3);
  auto with_d = d_sharp.spellWithLetter(Letter::D);
  ASSERT_TRUE(with_d.has_value());
  EXPECT_EQ(with_d->toString(), "D#");

  auto with_e = d_sharp.spellWithLetter(Letter::E);
  ASSERT_TRUE(with_e.has_value());
  EXPECT_EQ(with_e->toString(), "Eb");

  EXPECT_FALSE(d_sharp.spellWithLetter(Letter::F).has_value());
  EXPECT_FALSE(d_sharp.spellWithLetter(Letter::B).has_value());
}

TEST(PitchClassTest, SpellAcrossOctaveBoundary) {
  auto b_sharp = PitchClass(0).spellWithLetter(Letter::B);
  ASSERT_TRUE(b_sharp.has_value());
  EXPECT_EQ(b_sharp->toString(), "B#");

  auto c_flat = PitchClass(11).spellWithLetter(Letter::C);
  ASSERT_TRUE(c_flat.has_value());
  EXPECT_EQ(c_flat->toString(), "Cb");

  auto b_double_sharp = PitchClass(1).spellWithLetter(Letter::B);
  ASSERT_TRUE(b_double_sharp.has_value());
  EXPECT_EQ(b_double_sharp->toString(), "Bx");
}

TEST(PitchClassTest, DefaultSpellingUsesSharps) {
  const char* expected[] = {"C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"};
  for (int pc = 0; pc < 12; ++pc) {
    EXPECT_EQ(PitchClass(pc).toString(), expected[pc]) << "pc " << pc;
  }
}

// ============================================================================
// Note
// ============================================================================

TEST(NoteTest, ComposeAndOctave) {
  auto c4 = Note::compose(PitchClass(0), 4);
  ASSERT_TRUE(c4.has_value());
  EXPECT_EQ(c4->value(), 60);
  EXPECT_EQ(c4->octave(), 4);

  auto lowest = Note::compose(PitchClass(0), -1);
  ASSERT_TRUE(lowest.has_value());
  EXPECT_EQ(lowest->value(), 0);

  auto g9 = Note::compose(PitchClass(7), 9);
  ASSERT_TRUE(g9.has_value());
  EXPECT_EQ(g9->value(), 127);

  EXPECT_FALSE(Note::compose(PitchClass(8), 9).has_value());
  EXPECT_FALSE(Note::compose(PitchClass(0), -2).has_value());
}

TEST(NoteTest, FromIntRange) {
  EXPECT_TRUE(Note::fromInt(0).has_value());
  EXPECT_TRUE(Note::fromInt(127).has_value());
  EXPECT_FALSE(Note::fromInt(-1).has_value());
  EXPECT_FALSE(Note::fromInt(128).has_value());
}

TEST(NoteTest, Transposed) {
  Note e4(64);
  auto up = e4.transposed(3);
  ASSERT_TRUE(up.has_value());
  EXPECT_EQ(up->value(), 67);
  EXPECT_FALSE(Note(126).transposed(2).has_value());
  EXPECT_FALSE(Note(1).transposed(-2).has_value());
}

TEST(NoteTest, SpellWithLetterCorrectsOctave) {
  // C5 spelled with B belongs to octave 4.
  auto b_sharp = Note(72).spellWithLetter(Letter::B);
  ASSERT_TRUE(b_sharp.has_value());
  EXPECT_EQ(b_sharp->toString(), "B#4");
  EXPECT_EQ(b_sharp->midiValue(), 72);

  // B3 spelled with C belongs to octave 4.
  auto c_flat = Note(59).spellWithLetter(Letter::C);
  ASSERT_TRUE(c_flat.has_value());
  EXPECT_EQ(c_flat->toString(), "Cb4");
  EXPECT_EQ(c_flat->midiValue(), 59);

  EXPECT_FALSE(Note(60).spellWithLetter(Letter::E).has_value());
}

TEST(NoteTest, ToStringAndStream) {
  EXPECT_EQ(Note(61).toString(), "C#4");
  EXPECT_EQ(Note(0).toString(), "C-1");

  std::ostringstream oss;
  oss << Note(60);
  EXPECT_EQ(oss.str(), "C4 (60)");
}

TEST(NoteTest, Ordering) {
  EXPECT_TRUE(Note(60) < Note(61));
  EXPECT_EQ(Note(60), Note(60));
  EXPECT_NE(Note(60), Note(72));
}

// ============================================================================
// NamedNote
// ============================================================================

TEST(NamedNoteTest, MidiValue) {
  EXPECT_EQ(NamedNote(NamedKey(Letter::A, Accidental::Natural), 4).midiValue(), 69);
  EXPECT_EQ(NamedNote(NamedKey(Letter::E, Accidental::Flat), 4).midiValue(), 63);
  EXPECT_EQ(NamedNote(NamedKey(Letter::C, Accidental::Natural), -1).midiValue(), 0);
}

TEST(NamedNoteTest, ToNoteOutOfRange) {
  EXPECT_FALSE(NamedNote(NamedKey(Letter::C, Accidental::Flat), -1).toNote().has_value());
  EXPECT_FALSE(NamedNote(NamedKey(Letter::A, Accidental::Natural), 9).toNote().has_value());
  auto g9 = NamedNote(NamedKey(Letter::G, Accidental::Natural), 9).toNote();
  ASSERT_TRUE(g9.has_value());
  EXPECT_EQ(g9->value(), 127);
}

TEST(NamedNoteTest, UnicodeToString) {
  NamedNote f_sharp(NamedKey(Letter::F, Accidental::Sharp), 3);
  EXPECT_EQ(f_sharp.toString(), "F#3");
  EXPECT_EQ(f_sharp.toString(AccidentalStyle::Unicode), "F\xE2\x99\xAF" "3");
}

// ============================================================================
// Parsing
// ============================================================================

TEST(KeyParseTest, NamedKeys) {
  auto eb = parseNamedKey("Eb");
  ASSERT_TRUE(eb.has_value());
  EXPECT_EQ(*eb, NamedKey(Letter::E, Accidental::Flat));

  auto fx = parseNamedKey("Fx");
  ASSERT_TRUE(fx.has_value());
  EXPECT_EQ(fx->pitchClass().value(), 7);

  auto unicode_flat = parseNamedKey("B\xE2\x99\xAD");
  ASSERT_TRUE(unicode_flat.has_value());
  EXPECT_EQ(*unicode_flat, NamedKey(Letter::B, Accidental::Flat));

  EXPECT_FALSE(parseNamedKey("").has_value());
  EXPECT_FALSE(parseNamedKey("H").has_value());
  EXPECT_FALSE(parseNamedKey("c").has_value());
  EXPECT_FALSE(parseNamedKey("C##").has_value());
}

TEST(KeyParseTest, NamedNotes) {
  auto c4 = parseNamedNote("C4");
  ASSERT_TRUE(c4.has_value());
  EXPECT_EQ(c4->midiValue(), 60);

  auto bb_low = parseNamedNote("Bb-1");
  ASSERT_TRUE(bb_low.has_value());
  EXPECT_EQ(bb_low->octave, -1);
  EXPECT_EQ(bb_low->midiValue(), 10);

  EXPECT_FALSE(parseNamedNote("C").has_value());
  EXPECT_FALSE(parseNamedNote("C10").has_value());
  EXPECT_FALSE(parseNamedNote("X4").has_value());
}

TEST(KeyParseTest, ReadAccidentalAdvancesPosition) {
  std::string text = "Ebharm";
  size_t pos = 1;
  EXPECT_EQ(readAccidental(text, pos), Accidental::Flat);
  EXPECT_EQ(pos, 2u);

  pos = 2;
  EXPECT_EQ(readAccidental(text, pos), Accidental::Natural);
  EXPECT_EQ(pos, 2u);
}

}  // namespace
}  // namespace moira
