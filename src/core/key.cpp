/**
 * @file key.cpp
 * @brief Implementation of pitch class, note and spelling helpers.
 */

#include "core/key.h"

#include <cstring>

namespace moira {

namespace {

// UTF-8 encodings of U+266D, U+266F and U+1D12A.
constexpr const char* kUnicodeFlat = "\xE2\x99\xAD";
constexpr const char* kUnicodeSharp = "\xE2\x99\xAF";
constexpr const char* kUnicodeDoubleSharp = "\xF0\x9D\x84\xAA";

constexpr std::array<Letter, 7> kLetters = {Letter::C, Letter::D, Letter::E, Letter::F,
                                            Letter::G, Letter::A, Letter::B};

bool startsWithAt(const std::string& text, size_t pos, const char* prefix) {
  size_t len = std::strlen(prefix);
  return text.size() >= pos + len && text.compare(pos, len, prefix) == 0;
}

std::optional<Letter> letterFromChar(char c) {
  switch (c) {
    case 'C': return Letter::C;
    case 'D': return Letter::D;
    case 'E': return Letter::E;
    case 'F': return Letter::F;
    case 'G': return Letter::G;
    case 'A': return Letter::A;
    case 'B': return Letter::B;
    default: return std::nullopt;
  }
}

}  // namespace

int letterPitchClass(Letter letter) {
  switch (letter) {
    case Letter::C: return 0;
    case Letter::D: return 2;
    case Letter::E: return 4;
    case Letter::F: return 5;
    case Letter::G: return 7;
    case Letter::A: return 9;
    case Letter::B: return 11;
  }
  return 0;
}

char letterName(Letter letter) {
  static const char names[] = {'C', 'D', 'E', 'F', 'G', 'A', 'B'};
  return names[static_cast<int>(letter)];
}

std::array<Letter, 7> lettersFrom(Letter start) {
  std::array<Letter, 7> result{};
  int first = static_cast<int>(start);
  for (int i = 0; i < 7; ++i) {
    result[i] = kLetters[(first + i) % 7];
  }
  return result;
}

const char* accidentalSymbol(Accidental accidental, AccidentalStyle style) {
  bool unicode = style == AccidentalStyle::Unicode;
  switch (accidental) {
    case Accidental::Flat: return unicode ? kUnicodeFlat : "b";
    case Accidental::Natural: return "";
    case Accidental::Sharp: return unicode ? kUnicodeSharp : "#";
    case Accidental::DoubleSharp: return unicode ? kUnicodeDoubleSharp : "x";
  }
  return "";
}

// ============================================================================
// NamedKey / PitchClass
// ============================================================================

PitchClass NamedKey::pitchClass() const {
  return PitchClass(letterPitchClass(letter) + accidentalValue(accidental));
}

std::string NamedKey::toString(AccidentalStyle style) const {
  std::string result(1, letterName(letter));
  result += accidentalSymbol(accidental, style);
  return result;
}

std::optional<NamedKey> PitchClass::spellWithLetter(Letter letter) const {
  // Signed distance from the natural letter, folded into [-5, 6].
  int diff = (value_ - letterPitchClass(letter) + 12) % 12;
  if (diff > 6) diff -= 12;

  switch (diff) {
    case -1: return NamedKey(letter, Accidental::Flat);
    case 0: return NamedKey(letter, Accidental::Natural);
    case 1: return NamedKey(letter, Accidental::Sharp);
    case 2: return NamedKey(letter, Accidental::DoubleSharp);
    default: return std::nullopt;
  }
}

NamedKey PitchClass::defaultSpelling() const {
  static const NamedKey kDefaults[12] = {
      {Letter::C, Accidental::Natural}, {Letter::C, Accidental::Sharp},
      {Letter::D, Accidental::Natural}, {Letter::D, Accidental::Sharp},
      {Letter::E, Accidental::Natural}, {Letter::F, Accidental::Natural},
      {Letter::F, Accidental::Sharp},   {Letter::G, Accidental::Natural},
      {Letter::G, Accidental::Sharp},   {Letter::A, Accidental::Natural},
      {Letter::A, Accidental::Sharp},   {Letter::B, Accidental::Natural},
  };
  return kDefaults[value_];
}

// ============================================================================
// Note / NamedNote
// ============================================================================

std::optional<Note> Note::compose(PitchClass pc, int octave) {
  // C-1 is 0, C0 is 12.
  return fromInt(pc.value() + (octave + 1) * 12);
}

std::optional<Note> Note::fromInt(int value) {
  if (value < 0 || value > 127) return std::nullopt;
  return Note(static_cast<uint8_t>(value));
}

std::optional<Note> Note::transposed(int semitones) const { return fromInt(value_ + semitones); }

std::optional<NamedNote> Note::spellWithLetter(Letter letter) const {
  auto key = pitchClass().spellWithLetter(letter);
  if (!key) return std::nullopt;

  // value - (letter + accidental) is an exact multiple of 12.
  int base = static_cast<int>(value_) - letterPitchClass(letter) - accidentalValue(key->accidental);
  return NamedNote(*key, static_cast<int8_t>(base / 12 - 1));
}

NamedNote Note::defaultSpelling() const {
  return NamedNote(pitchClass().defaultSpelling(), static_cast<int8_t>(octave()));
}

std::string Note::toString() const { return defaultSpelling().toString(); }

int NamedNote::midiValue() const {
  return (octave + 1) * 12 + letterPitchClass(key.letter) + accidentalValue(key.accidental);
}

std::optional<Note> NamedNote::toNote() const { return Note::fromInt(midiValue()); }

std::string NamedNote::toString(AccidentalStyle style) const {
  return key.toString(style) + std::to_string(octave);
}

// ============================================================================
// Parsing
// ============================================================================

Accidental readAccidental(const std::string& text, size_t& pos) {
  if (pos >= text.size()) return Accidental::Natural;

  switch (text[pos]) {
    case 'b': ++pos; return Accidental::Flat;
    case '#': ++pos; return Accidental::Sharp;
    case 'x': ++pos; return Accidental::DoubleSharp;
    default: break;
  }
  if (startsWithAt(text, pos, kUnicodeFlat)) {
    pos += std::strlen(kUnicodeFlat);
    return Accidental::Flat;
  }
  if (startsWithAt(text, pos, kUnicodeSharp)) {
    pos += std::strlen(kUnicodeSharp);
    return Accidental::Sharp;
  }
  if (startsWithAt(text, pos, kUnicodeDoubleSharp)) {
    pos += std::strlen(kUnicodeDoubleSharp);
    return Accidental::DoubleSharp;
  }
  return Accidental::Natural;
}

std::optional<NamedKey> parseNamedKey(const std::string& text) {
  if (text.empty()) return std::nullopt;
  auto letter = letterFromChar(text[0]);
  if (!letter) return std::nullopt;

  size_t pos = 1;
  Accidental accidental = readAccidental(text, pos);
  if (pos != text.size()) return std::nullopt;
  return NamedKey(*letter, accidental);
}

std::optional<NamedNote> parseNamedNote(const std::string& text) {
  if (text.size() < 2) return std::nullopt;

  int octave = 0;
  size_t key_len = 0;
  if (text.size() >= 3 && text.compare(text.size() - 2, 2, "-1") == 0) {
    octave = -1;
    key_len = text.size() - 2;
  } else {
    char last = text.back();
    if (last < '0' || last > '9') return std::nullopt;
    octave = last - '0';
    key_len = text.size() - 1;
  }

  auto key = parseNamedKey(text.substr(0, key_len));
  if (!key) return std::nullopt;
  return NamedNote(*key, static_cast<int8_t>(octave));
}

std::ostream& operator<<(std::ostream& os, const NamedKey& key) { return os << key.toString(); }

std::ostream& operator<<(std::ostream& os, const NamedNote& note) {
  return os << note.toString();
}

std::ostream& operator<<(std::ostream& os, const PitchClass& pc) { return os << pc.toString(); }

std::ostream& operator<<(std::ostream& os, const Note& note) {
  return os << note.toString() << " (" << static_cast<int>(note.value()) << ")";
}

}  // namespace moira
