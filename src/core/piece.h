/**
 * @file piece.h
 * @brief Voices written in scale degrees and the piece that holds them.
 */

#ifndef MOIRA_CORE_PIECE_H
#define MOIRA_CORE_PIECE_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/midi_track.h"
#include "core/scale.h"

namespace moira {

/// @brief A scale degree, or a rest when position is empty, with a duration.
struct TimedNote {
  std::optional<int> position;  ///< Scale degree relative to the voice octave
  Tick duration = 0;            ///< Duration in ticks

  bool isRest() const { return !position.has_value(); }
};

/// @brief One melodic line: notes as scale degrees in a given scale and octave.
struct Voice {
  std::string id;
  Scale scale;
  int8_t octave = 4;
  Tick start = 0;                  ///< Start position in ticks
  std::optional<uint8_t> program;  ///< GM program, RenderConfig default when unset
  std::optional<uint8_t> velocity; ///< Note velocity, RenderConfig default when unset
  std::vector<TimedNote> notes;

  /// @brief Tick at which the last note or rest ends.
  Tick endTick() const;

  /// @brief Spelled notes in order, rests omitted.
  std::vector<NamedNote> namedNotes() const;

  /**
   * @brief Render to absolute-time note events.
   *
   * Rests only advance time; each note starts where the previous note or
   * rest ended, beginning at @ref start.
   * @param default_velocity Velocity used when the voice sets none
   * @param track Output track (appended to)
   * @param error Set when a degree falls outside MIDI range
   * @return true on success
   */
  bool render(uint8_t default_velocity, MidiTrack& track, std::string& error) const;
};

/// @brief A piece: tempo plus voices in output order.
struct Piece {
  uint16_t bpm = 120;
  std::vector<Voice> voices;

  /// @brief Voice by id, or nullptr.
  const Voice* findVoice(const std::string& id) const;

  /// @brief End of the longest voice.
  Tick endTick() const;
};

}  // namespace moira

#endif  // MOIRA_CORE_PIECE_H
