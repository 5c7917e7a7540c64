/**
 * @file chord.h
 * @brief Diatonic chords built by stacking thirds within a scale.
 */

#ifndef MOIRA_CORE_CHORD_H
#define MOIRA_CORE_CHORD_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/key.h"
#include "core/scale.h"

namespace moira {

/// @brief Number of stacked thirds.
enum class ChordSize : uint8_t {
  Triad = 3,   ///< Root, third, fifth
  Seventh = 4  ///< Root, third, fifth, seventh
};

/// @brief Chord quality, derived from the intervals above the root.
enum class ChordQuality : uint8_t {
  Major,            ///< 0 4 7
  Minor,            ///< 0 3 7
  Diminished,       ///< 0 3 6
  Augmented,        ///< 0 4 8
  Major7,           ///< 0 4 7 11
  Dominant7,        ///< 0 4 7 10
  Minor7,           ///< 0 3 7 10
  HalfDiminished7,  ///< 0 3 6 10
  Diminished7,      ///< 0 3 6 9
  MinorMajor7,      ///< 0 3 7 11
  AugmentedMajor7   ///< 0 4 8 11
};

/// @brief Human-readable quality name ("Half-diminished seventh").
const char* chordQualityName(ChordQuality quality);

/**
 * @brief Quality for a set of semitone intervals above the root.
 * @param intervals Ascending intervals, root excluded (e.g. {4, 7})
 * @return The quality, or nullopt for interval sets that are not tertian
 */
std::optional<ChordQuality> qualityFromIntervals(const std::vector<int>& intervals);

/// @brief A spelled chord on a scale degree.
class Chord {
 public:
  Chord(ChordQuality quality, int degree, std::vector<NamedNote> notes)
      : quality_(quality), degree_(degree), notes_(std::move(notes)) {}

  const NamedKey& root() const { return notes_.front().key; }
  ChordQuality quality() const { return quality_; }

  /// @brief Scale degree of the root (0-based).
  int degree() const { return degree_; }

  /// @brief Spelled chord tones, root first, ascending.
  const std::vector<NamedNote>& notes() const { return notes_; }

  /// @brief MIDI note numbers of the chord tones.
  std::vector<uint8_t> midiNotes() const;

  /// @brief Lead-sheet symbol, e.g. "Dm", "G7", "Bdim" ("B°" in Unicode style).
  std::string symbol(AccidentalStyle style = AccidentalStyle::Ascii) const;

  /// @brief Roman numeral analysis, e.g. "ii", "V7", "viidim".
  std::string romanNumeral(AccidentalStyle style = AccidentalStyle::Ascii) const;

 private:
  ChordQuality quality_;
  int degree_;
  std::vector<NamedNote> notes_;
};

/// @brief Chord or the reason it could not be built.
struct ChordResult {
  std::optional<Chord> chord;
  std::string error;

  bool ok() const { return chord.has_value(); }
};

/**
 * @brief Build the chord on a scale degree by stacking thirds.
 *
 * Uses scale positions degree, degree+2, degree+4 (and degree+6 for
 * sevenths). Requires a seven-degree scale.
 * @param scale Scale providing the chord tones
 * @param degree Scale position of the root (wraps like Scale::degreeNote)
 * @param octave Octave of the scale tonic
 * @param size Triad or seventh chord
 */
ChordResult buildChord(const Scale& scale, int degree, int octave, ChordSize size);

/**
 * @brief Chords on every degree of a seven-degree scale.
 * @return One chord per degree, or an empty vector with @p error set
 */
std::vector<Chord> diatonicChords(const Scale& scale, int octave, ChordSize size,
                                  std::string* error = nullptr);

}  // namespace moira

#endif  // MOIRA_CORE_CHORD_H
