/**
 * @file key.h
 * @brief Pitch classes, MIDI notes and their spelled (named) forms.
 *
 * None of these types know about scales. PitchClass and Note are the raw
 * semitone values; NamedKey and NamedNote carry a spelling, so that D# and
 * Eb (or B#4 and C5) stay distinct. Scale-aware degrees live in core/scale.h.
 */

#ifndef MOIRA_CORE_KEY_H
#define MOIRA_CORE_KEY_H

#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace moira {

/// @brief Note letter (base key) without accidental.
enum class Letter : uint8_t { C = 0, D, E, F, G, A, B };

/// @brief Accidental applied to a letter. Value is the semitone offset.
enum class Accidental : int8_t { Flat = -1, Natural = 0, Sharp = 1, DoubleSharp = 2 };

/// @brief How accidentals are rendered in note names.
enum class AccidentalStyle : uint8_t {
  Ascii,   ///< b, #, x
  Unicode  ///< flat, sharp and double sharp signs
};

/// @brief Natural pitch class of a letter (C=0, D=2, ... B=11).
int letterPitchClass(Letter letter);

/// @brief Upper-case name of a letter.
char letterName(Letter letter);

/// @brief The seven letters in cyclic order starting at @p start.
std::array<Letter, 7> lettersFrom(Letter start);

/// @brief Semitone offset of an accidental.
inline int accidentalValue(Accidental accidental) { return static_cast<int>(accidental); }

/// @brief Textual form of an accidental ("" for natural).
const char* accidentalSymbol(Accidental accidental, AccidentalStyle style);

class PitchClass;
class Note;

/// @brief A pitch class with a spelling, e.g. D# or Eb.
struct NamedKey {
  Letter letter = Letter::C;
  Accidental accidental = Accidental::Natural;

  NamedKey() = default;
  NamedKey(Letter l, Accidental a) : letter(l), accidental(a) {}

  PitchClass pitchClass() const;
  std::string toString(AccidentalStyle style = AccidentalStyle::Ascii) const;

  bool operator==(const NamedKey& other) const {
    return letter == other.letter && accidental == other.accidental;
  }
  bool operator!=(const NamedKey& other) const { return !(*this == other); }
};

/// @brief One of the 12 semitones of Western tuning. Always in [0, 11].
class PitchClass {
 public:
  PitchClass() = default;

  /// @brief Build from any integer (Euclidean remainder).
  explicit PitchClass(int value) : value_(static_cast<uint8_t>(((value % 12) + 12) % 12)) {}

  int value() const { return value_; }

  /// @brief Offset this pitch class, wrapping around the octave.
  PitchClass operator+(int semitones) const { return PitchClass(value_ + semitones); }

  /**
   * @brief Spell this pitch class starting with the given letter.
   * @param letter Letter the spelling must use
   * @return Spelled key, or nullopt if no supported accidental reaches it
   */
  std::optional<NamedKey> spellWithLetter(Letter letter) const;

  /// @brief Sharps-based spelling (C C# D D# E F F# G G# A A# B).
  NamedKey defaultSpelling() const;

  std::string toString() const { return defaultSpelling().toString(); }

  bool operator==(const PitchClass& other) const { return value_ == other.value_; }
  bool operator!=(const PitchClass& other) const { return value_ != other.value_; }

 private:
  uint8_t value_ = 0;
};

struct NamedNote;

/// @brief MIDI note number (0 is C-1, 60 is C4, 127 is G9).
class Note {
 public:
  Note() = default;
  explicit Note(uint8_t value) : value_(value) {}

  uint8_t value() const { return value_; }
  PitchClass pitchClass() const { return PitchClass(value_); }
  int octave() const { return value_ / 12 - 1; }

  /**
   * @brief Build a note from a pitch class and octave.
   * @return The note, or nullopt if it falls outside 0..127
   */
  static std::optional<Note> compose(PitchClass pc, int octave);

  /// @brief Build a note from a raw number, or nullopt outside 0..127.
  static std::optional<Note> fromInt(int value);

  /// @brief Offset by semitones, nullopt if the result leaves MIDI range.
  std::optional<Note> transposed(int semitones) const;

  /**
   * @brief Spell this note with the given letter.
   *
   * The octave follows the letter across the B/C boundary, so C5 spelled
   * with B is B#4 and B4 spelled with C is Cb5.
   */
  std::optional<NamedNote> spellWithLetter(Letter letter) const;

  NamedNote defaultSpelling() const;

  std::string toString() const;

  bool operator==(const Note& other) const { return value_ == other.value_; }
  bool operator!=(const Note& other) const { return value_ != other.value_; }
  bool operator<(const Note& other) const { return value_ < other.value_; }

 private:
  uint8_t value_ = 0;
};

/// @brief A note with a spelling, e.g. Eb4 or D#4.
struct NamedNote {
  NamedKey key;
  int8_t octave = 4;

  NamedNote() = default;
  NamedNote(NamedKey k, int8_t oct) : key(k), octave(oct) {}

  /// @brief Raw MIDI number, may lie outside 0..127.
  int midiValue() const;

  /// @brief MIDI note, or nullopt outside 0..127. Cb5 is B4, B#4 is C5.
  std::optional<Note> toNote() const;

  std::string toString(AccidentalStyle style = AccidentalStyle::Ascii) const;

  bool operator==(const NamedNote& other) const {
    return key == other.key && octave == other.octave;
  }
  bool operator!=(const NamedNote& other) const { return !(*this == other); }
};

/**
 * @brief Parse a spelled key such as "C", "Eb", "F#", "Gx" or "E♭".
 * @return The key, or nullopt if @p text is not a key name
 */
std::optional<NamedKey> parseNamedKey(const std::string& text);

/**
 * @brief Parse a spelled note such as "C4", "Eb-1" or "F♯5".
 *
 * Octave is -1 or a single digit.
 */
std::optional<NamedNote> parseNamedNote(const std::string& text);

/**
 * @brief Consume an accidental at the start of @p text.
 * @param text Input text
 * @param pos Read position, advanced past the accidental on success
 * @return The accidental (Natural when none is present)
 */
Accidental readAccidental(const std::string& text, size_t& pos);

std::ostream& operator<<(std::ostream& os, const NamedKey& key);
std::ostream& operator<<(std::ostream& os, const NamedNote& note);
std::ostream& operator<<(std::ostream& os, const PitchClass& pc);
std::ostream& operator<<(std::ostream& os, const Note& note);

}  // namespace moira

#endif  // MOIRA_CORE_KEY_H
