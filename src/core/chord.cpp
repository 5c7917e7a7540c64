/**
 * @file chord.cpp
 * @brief Implementation of diatonic chord construction and naming.
 */

#include "core/chord.h"

#include <cctype>

namespace moira {

namespace {

// UTF-8 encodings of U+00B0 (degree sign) and U+00F8 (o with stroke).
constexpr const char* kUnicodeDim = "\xC2\xB0";
constexpr const char* kUnicodeHalfDim = "\xC3\xB8";

struct QualityDef {
  ChordQuality quality;
  const char* name;
  std::vector<int> intervals;
  bool upper_case;         // Roman numeral case
  const char* ascii;       // Lead-sheet suffix
  std::string unicode;     // Lead-sheet suffix, Unicode style
};

const std::vector<QualityDef>& qualityDefs() {
  static const std::vector<QualityDef> kDefs = {
      {ChordQuality::Major, "Major", {4, 7}, true, "", ""},
      {ChordQuality::Minor, "Minor", {3, 7}, false, "m", "m"},
      {ChordQuality::Diminished, "Diminished", {3, 6}, false, "dim", kUnicodeDim},
      {ChordQuality::Augmented, "Augmented", {4, 8}, true, "aug", "+"},
      {ChordQuality::Major7, "Major seventh", {4, 7, 11}, true, "maj7", "maj7"},
      {ChordQuality::Dominant7, "Dominant seventh", {4, 7, 10}, true, "7", "7"},
      {ChordQuality::Minor7, "Minor seventh", {3, 7, 10}, false, "m7", "m7"},
      {ChordQuality::HalfDiminished7, "Half-diminished seventh", {3, 6, 10}, false, "m7b5",
       std::string(kUnicodeHalfDim) + "7"},
      {ChordQuality::Diminished7, "Diminished seventh", {3, 6, 9}, false, "dim7",
       std::string(kUnicodeDim) + "7"},
      {ChordQuality::MinorMajor7, "Minor-major seventh", {3, 7, 11}, false, "mM7", "mM7"},
      {ChordQuality::AugmentedMajor7, "Augmented major seventh", {4, 8, 11}, true, "augM7",
       "+M7"},
  };
  return kDefs;
}

const QualityDef& qualityDef(ChordQuality quality) {
  for (const auto& def : qualityDefs()) {
    if (def.quality == quality) return def;
  }
  return qualityDefs().front();
}

const char* kRomanNumerals[] = {"I", "II", "III", "IV", "V", "VI", "VII"};

}  // namespace

const char* chordQualityName(ChordQuality quality) { return qualityDef(quality).name; }

std::optional<ChordQuality> qualityFromIntervals(const std::vector<int>& intervals) {
  for (const auto& def : qualityDefs()) {
    if (def.intervals == intervals) return def.quality;
  }
  return std::nullopt;
}

std::vector<uint8_t> Chord::midiNotes() const {
  std::vector<uint8_t> result;
  result.reserve(notes_.size());
  for (const auto& note : notes_) {
    result.push_back(static_cast<uint8_t>(note.midiValue()));
  }
  return result;
}

std::string Chord::symbol(AccidentalStyle style) const {
  const QualityDef& def = qualityDef(quality_);
  return root().toString(style) + (style == AccidentalStyle::Unicode ? def.unicode : def.ascii);
}

std::string Chord::romanNumeral(AccidentalStyle style) const {
  const QualityDef& def = qualityDef(quality_);
  std::string numeral = kRomanNumerals[((degree_ % 7) + 7) % 7];
  if (!def.upper_case) {
    for (auto& c : numeral) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }

  bool unicode = style == AccidentalStyle::Unicode;
  switch (quality_) {
    case ChordQuality::Major:
    case ChordQuality::Minor:
      return numeral;
    case ChordQuality::Diminished:
      return numeral + (unicode ? kUnicodeDim : "dim");
    case ChordQuality::Augmented:
      return numeral + "+";
    case ChordQuality::Major7:
      return numeral + "maj7";
    case ChordQuality::Dominant7:
    case ChordQuality::Minor7:
      return numeral + "7";
    case ChordQuality::HalfDiminished7:
      return numeral + (unicode ? std::string(kUnicodeHalfDim) + "7" : std::string("m7b5"));
    case ChordQuality::Diminished7:
      return numeral + (unicode ? std::string(kUnicodeDim) + "7" : std::string("dim7"));
    case ChordQuality::MinorMajor7:
      return numeral + "maj7";
    case ChordQuality::AugmentedMajor7:
      return numeral + "+maj7";
  }
  return numeral;
}

ChordResult buildChord(const Scale& scale, int degree, int octave, ChordSize size) {
  ChordResult result;
  if (scale.size() != 7) {
    result.error = "Chords need a seven-degree scale, " + scale.name() + " has " +
                   std::to_string(scale.size());
    return result;
  }

  int tones = static_cast<int>(size);
  std::vector<NamedNote> notes;
  notes.reserve(tones);
  for (int i = 0; i < tones; ++i) {
    auto note = scale.degreeNote(degree + 2 * i, octave);
    if (!note) {
      result.error = "Chord on degree " + std::to_string(degree) + " of " + scale.name() +
                     " leaves MIDI range";
      return result;
    }
    notes.push_back(*note);
  }

  std::vector<int> intervals;
  int root = notes.front().midiValue();
  for (size_t i = 1; i < notes.size(); ++i) {
    intervals.push_back(notes[i].midiValue() - root);
  }

  auto quality = qualityFromIntervals(intervals);
  if (!quality) {
    result.error = "Chord on degree " + std::to_string(degree) + " of " + scale.name() +
                   " is not a recognized tertian chord";
    return result;
  }

  result.chord = Chord(*quality, degree, std::move(notes));
  return result;
}

std::vector<Chord> diatonicChords(const Scale& scale, int octave, ChordSize size,
                                  std::string* error) {
  std::vector<Chord> chords;
  for (int degree = 0; degree < static_cast<int>(scale.size()); ++degree) {
    ChordResult result = buildChord(scale, degree, octave, size);
    if (!result.ok()) {
      if (error) *error = result.error;
      return {};
    }
    chords.push_back(std::move(*result.chord));
  }
  return chords;
}

}  // namespace moira
