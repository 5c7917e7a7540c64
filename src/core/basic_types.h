/**
 * @file basic_types.h
 * @brief Fundamental types: Tick, MidiEvent, NoteEvent.
 */

#ifndef MOIRA_CORE_BASIC_TYPES_H
#define MOIRA_CORE_BASIC_TYPES_H

#include <cstdint>

namespace moira {

/// Time unit in ticks.
using Tick = uint32_t;

/// Ticks per quarter note (MIDI division of every file Moira writes).
constexpr Tick TICKS_PER_BEAT = 24;

/// Highest valid MIDI note number (G9).
constexpr int MIDI_NOTE_MAX = 127;

/// Microseconds per minute, for tempo meta events.
constexpr uint32_t kMicrosecondsPerMinute = 60000000;

/// @brief Raw MIDI event for SMF output only.
struct MidiEvent {
  Tick tick;       ///< Absolute time in ticks
  uint8_t status;  ///< MIDI status byte
  uint8_t data1;   ///< First data byte
  uint8_t data2;   ///< Second data byte
};

/// @brief Note event (combines note-on/off for easy editing).
struct NoteEvent {
  Tick start_tick = 0;   ///< Start time in ticks
  Tick duration = 0;     ///< Duration in ticks
  uint8_t note = 0;      ///< MIDI note number (0-127)
  uint8_t velocity = 0;  ///< MIDI velocity (0-127)

  NoteEvent() = default;

  NoteEvent(Tick start, Tick dur, uint8_t n, uint8_t vel)
      : start_tick(start), duration(dur), note(n), velocity(vel) {}
};

}  // namespace moira

#endif  // MOIRA_CORE_BASIC_TYPES_H
