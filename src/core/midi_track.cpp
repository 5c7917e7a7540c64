/**
 * @file midi_track.cpp
 * @brief Implementation of MidiTrack operations.
 */

#include "core/midi_track.h"

#include <algorithm>

namespace moira {

void MidiTrack::addNote(const NoteEvent& event) { notes_.push_back(event); }

void MidiTrack::addNote(Tick startTick, Tick length, uint8_t note, uint8_t velocity) {
  notes_.emplace_back(startTick, length, note, velocity);
}

size_t MidiTrack::transpose(int semitones) {
  size_t clamped = 0;
  for (auto& note : notes_) {
    int new_pitch = note.note + semitones;
    if (new_pitch < 0 || new_pitch > MIDI_NOTE_MAX) ++clamped;
    note.note = static_cast<uint8_t>(std::clamp(new_pitch, 0, MIDI_NOTE_MAX));
  }
  return clamped;
}

void MidiTrack::clear() {
  notes_.clear();
}

Tick MidiTrack::lastTick() const {
  Tick last = 0;
  for (const auto& note : notes_) {
    Tick noteEnd = note.start_tick + note.duration;
    if (noteEnd > last) last = noteEnd;
  }
  return last;
}

std::pair<uint8_t, uint8_t> MidiTrack::analyzeRange() const {
  if (notes_.empty()) {
    return {127, 0};  // Invalid range indicates empty track
  }

  uint8_t lowest = 127;
  uint8_t highest = 0;
  for (const auto& note : notes_) {
    if (note.note < lowest) lowest = note.note;
    if (note.note > highest) highest = note.note;
  }
  return {lowest, highest};
}

std::vector<MidiEvent> MidiTrack::toMidiEvents(uint8_t channel) const {
  std::vector<MidiEvent> events;
  events.reserve(notes_.size() * 2);

  for (const auto& note : notes_) {
    events.push_back(
        {note.start_tick, static_cast<uint8_t>(0x90 | channel), note.note, note.velocity});
    events.push_back(
        {note.start_tick + note.duration, static_cast<uint8_t>(0x80 | channel), note.note, 0});
  }

  // At the same tick a note-off (0x80) sorts before a note-on (0x90), so a
  // repeated pitch is closed before it is struck again.
  std::stable_sort(events.begin(), events.end(), [](const MidiEvent& a, const MidiEvent& b) {
    if (a.tick != b.tick) return a.tick < b.tick;
    return (a.status & 0xF0) < (b.status & 0xF0);
  });

  return events;
}

}  // namespace moira
