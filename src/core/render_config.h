/**
 * @file render_config.h
 * @brief Output settings applied when a piece is rendered to MIDI.
 */

#ifndef MOIRA_CORE_RENDER_CONFIG_H
#define MOIRA_CORE_RENDER_CONFIG_H

#include <cstdint>

#include "midi/track_config.h"

namespace moira {

/// @brief Render settings. Per-track values in the score take precedence.
struct RenderConfig {
  uint8_t default_program = DEFAULT_PROG;        ///< GM program for tracks without one
  uint8_t default_velocity = DEFAULT_VELOCITY;  ///< Velocity for tracks without one
  uint16_t bpm_override = 0;                    ///< 0 = use the piece tempo
  int8_t transpose = 0;                         ///< Semitones applied to every note
  bool embed_metadata = true;                   ///< Write a MOIRA: text event
};

}  // namespace moira

#endif  // MOIRA_CORE_RENDER_CONFIG_H
