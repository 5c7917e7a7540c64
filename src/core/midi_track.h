/**
 * @file midi_track.h
 * @brief NoteEvent-based track container for MIDI output.
 */

#ifndef MOIRA_CORE_MIDI_TRACK_H
#define MOIRA_CORE_MIDI_TRACK_H

#include <cstddef>
#include <utility>
#include <vector>

#include "core/basic_types.h"

namespace moira {

/// @brief NoteEvent-based track container.
///
/// Voices render into a MidiTrack; MidiWriter converts it to MidiEvents.
class MidiTrack {
 public:
  MidiTrack() = default;

  /// @name Generation Operations
  /// @{
  void addNote(const NoteEvent& event);
  void addNote(Tick startTick, Tick length, uint8_t note, uint8_t velocity);
  /// @}

  /// @name Editing Operations
  /// @{

  /// @brief Transpose all notes, clamping to 0..127.
  /// @return Number of notes that had to be clamped
  size_t transpose(int semitones);

  void clear();
  /// @}

  /// @name Output Conversion
  /// @{

  /// @brief Note-on/off events sorted by time, note-off first at equal ticks.
  std::vector<MidiEvent> toMidiEvents(uint8_t channel) const;
  /// @}

  /// @name Accessors
  /// @{
  const std::vector<NoteEvent>& notes() const { return notes_; }
  bool empty() const { return notes_.empty(); }
  size_t noteCount() const { return notes_.size(); }
  Tick lastTick() const;
  /// @}

  /// @brief Analyze pitch range of this track.
  /// @return Pair of (lowest_note, highest_note). Returns (127, 0) if empty.
  std::pair<uint8_t, uint8_t> analyzeRange() const;

 private:
  std::vector<NoteEvent> notes_;
};

}  // namespace moira

#endif  // MOIRA_CORE_MIDI_TRACK_H
