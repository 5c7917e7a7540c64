/**
 * @file scale.h
 * @brief Scales, scale degrees and scale names.
 */

#ifndef MOIRA_CORE_SCALE_H
#define MOIRA_CORE_SCALE_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/key.h"

namespace moira {

/// @brief Built-in scale types.
enum class ScaleType : uint8_t {
  Major,            ///< Ionian (W-W-H-W-W-W-H)
  NaturalMinor,     ///< Aeolian (W-H-W-W-H-W-W)
  HarmonicMinor,    ///< Natural minor with raised 7th
  MelodicMinor,     ///< Natural minor with raised 6th and 7th (ascending form)
  Dorian,           ///< Minor with raised 6th
  Phrygian,         ///< Minor with lowered 2nd
  Lydian,           ///< Major with raised 4th
  Mixolydian,       ///< Major with lowered 7th
  Locrian,          ///< Diminished 5th mode
  MajorPentatonic,  ///< 1 2 3 5 6
  MinorPentatonic,  ///< 1 b3 4 5 b7
  Custom            ///< User-supplied offsets
};

/// @brief Number of built-in (non-custom) scale types.
constexpr uint8_t SCALE_TYPE_COUNT = 11;

/// @brief Semitone offsets from the tonic for a built-in type (empty for Custom).
std::vector<int8_t> scaleTypeOffsets(ScaleType type);

/// @brief Canonical name suffix of a built-in type ("maj", "harm", ...).
const char* scaleTypeSuffix(ScaleType type);

/// @brief Human-readable name of a type ("Harmonic minor").
const char* scaleTypeName(ScaleType type);

struct ScaleResult;

/**
 * @brief A scale: a spelled tonic and strictly increasing semitone offsets.
 *
 * On creation every degree receives a spelling, using consecutive letters
 * from the tonic where possible (so Eb harmonic minor reads Eb F Gb Ab Bb Cb D
 * rather than mixing sharps and flats). Degrees that cannot take the next
 * letter fall back to their default spelling and a warning is recorded.
 */
class Scale {
 public:
  /// @brief C major.
  Scale();

  /**
   * @brief Create a scale from a tonic and offsets.
   *
   * Offsets must be non-empty, within [0, 11] and strictly increasing.
   */
  static ScaleResult create(const NamedKey& tonic, const std::vector<int8_t>& offsets);

  /// @brief Create a built-in scale type on the given tonic.
  static Scale fromType(const NamedKey& tonic, ScaleType type);

  const NamedKey& tonic() const { return tonic_; }
  const std::vector<int8_t>& offsets() const { return offsets_; }
  const std::vector<NamedKey>& degrees() const { return degrees_; }
  size_t size() const { return offsets_.size(); }
  ScaleType type() const { return type_; }

  /// @brief Canonical name, e.g. "Ebharm" or "C{0,2,4,7,9}" for custom scales.
  std::string name() const;

  /// @brief Spelling fallbacks recorded while naming the degrees.
  const std::vector<std::string>& warnings() const { return warnings_; }

  /// @brief Spelled key of a degree. Positions wrap in both directions.
  NamedKey degreeKey(int position) const;

  /**
   * @brief Spelled note of a degree.
   *
   * Positions beyond the scale length move into neighbouring octaves:
   * in C major at octave 4, position -1 is B3 and position 7 is C5.
   * @return The note, or nullopt if it leaves MIDI range
   */
  std::optional<NamedNote> degreeNote(int position, int octave) const;

  /// @brief MIDI note of a degree, or nullopt if it leaves MIDI range.
  std::optional<Note> degreeMidiNote(int position, int octave) const;

  /// @brief Degree index of a pitch class, or nullopt if not in the scale.
  std::optional<int> findDegree(PitchClass pc) const;

 private:
  void spellDegrees();

  NamedKey tonic_;
  std::vector<int8_t> offsets_;
  std::vector<NamedKey> degrees_;
  ScaleType type_ = ScaleType::Custom;
  std::vector<std::string> warnings_;
};

/// @brief Scale or the reason it could not be built.
struct ScaleResult {
  std::optional<Scale> scale;
  std::string error;

  bool ok() const { return scale.has_value(); }
};

/**
 * @brief Parse a scale name.
 *
 * Accepted forms are `<key><type>` (e.g. "Cmaj", "F#min", "Ebharm",
 * "Dbdorian") and `<key>{o1,o2,...}` for custom offsets.
 */
ScaleResult parseScaleName(const std::string& text);

}  // namespace moira

#endif  // MOIRA_CORE_SCALE_H
