/**
 * @file track_config.h
 * @brief Channel and program assignments for MIDI output.
 */

#ifndef MOIRA_MIDI_TRACK_CONFIG_H
#define MOIRA_MIDI_TRACK_CONFIG_H

#include <cstddef>
#include <cstdint>

namespace moira {

/// GM percussion channel, never assigned to a voice.
constexpr uint8_t DRUMS_CH = 9;

/// Number of channels available to voices (all but the percussion channel).
constexpr uint8_t MELODIC_CHANNEL_COUNT = 15;

/// @name Program Assignments (GM)
/// @{
constexpr uint8_t HARPSICHORD_PROG = 6;  ///< Harpsichord
constexpr uint8_t DEFAULT_PROG = HARPSICHORD_PROG;
/// @}

/// Default note-on velocity.
constexpr uint8_t DEFAULT_VELOCITY = 127;

/// @brief Channel for the voice at @p index: 0-8, 10-15, then wraps.
inline uint8_t channelForTrack(size_t index) {
  uint8_t slot = static_cast<uint8_t>(index % MELODIC_CHANNEL_COUNT);
  return slot < DRUMS_CH ? slot : static_cast<uint8_t>(slot + 1);
}

}  // namespace moira

#endif  // MOIRA_MIDI_TRACK_CONFIG_H
