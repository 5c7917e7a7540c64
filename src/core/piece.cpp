/**
 * @file piece.cpp
 * @brief Implementation of voice rendering.
 */

#include "core/piece.h"

namespace moira {

Tick Voice::endTick() const {
  Tick end = start;
  for (const auto& note : notes) {
    end += note.duration;
  }
  return end;
}

std::vector<NamedNote> Voice::namedNotes() const {
  std::vector<NamedNote> result;
  for (const auto& note : notes) {
    if (note.isRest()) continue;
    auto named = scale.degreeNote(*note.position, octave);
    if (named) result.push_back(*named);
  }
  return result;
}

bool Voice::render(uint8_t default_velocity, MidiTrack& track, std::string& error) const {
  uint8_t vel = velocity.value_or(default_velocity);
  Tick current = start;

  for (const auto& note : notes) {
    if (!note.isRest()) {
      auto midi = scale.degreeMidiNote(*note.position, octave);
      if (!midi) {
        error = "Voice " + id + ": degree " + std::to_string(*note.position) + " at octave " +
                std::to_string(octave) + " is outside MIDI range";
        return false;
      }
      track.addNote(current, note.duration, midi->value(), vel);
    }
    current += note.duration;
  }
  return true;
}

const Voice* Piece::findVoice(const std::string& id) const {
  for (const auto& voice : voices) {
    if (voice.id == id) return &voice;
  }
  return nullptr;
}

Tick Piece::endTick() const {
  Tick end = 0;
  for (const auto& voice : voices) {
    Tick voice_end = voice.endTick();
    if (voice_end > end) end = voice_end;
  }
  return end;
}

}  // namespace moira
