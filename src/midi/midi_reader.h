/**
 * @file midi_reader.h
 * @brief Standard MIDI File (SMF Type 0/1) reader for inspecting output.
 */

#ifndef MOIRA_MIDI_READER_H
#define MOIRA_MIDI_READER_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"

namespace moira {

/**
 * @brief One MTrk chunk.
 */
struct ParsedTrack {
  std::string name;              ///< Track name meta event, empty if none
  uint8_t channel = 0;           ///< Channel of the last channel event
  int16_t program = -1;          ///< Program change, -1 if none
  std::vector<NoteEvent> notes;  ///< Notes sorted by start tick
};

/**
 * @brief Parsed Standard MIDI File.
 */
struct ParsedMidi {
  uint16_t format = 0;             ///< SMF format (0 or 1)
  uint16_t num_tracks = 0;         ///< Track count from the header
  uint16_t division = 0;           ///< Ticks per quarter note
  uint16_t bpm = 120;              ///< First tempo event, 120 if none
  std::string metadata;            ///< MOIRA: text event payload (JSON) if present
  std::vector<ParsedTrack> tracks;

  bool hasMoiraMetadata() const { return !metadata.empty(); }

  /// @brief Track by name (case-insensitive), or nullptr.
  const ParsedTrack* getTrack(const std::string& name) const;
};

/**
 * @brief Reader for SMF Type 0/1 files.
 *
 * Handles running status and note-on with velocity 0 as note-off. Notes still
 * sounding at the end of a track are closed at its last tick.
 */
class MidiReader {
 public:
  /**
   * @brief Read a MIDI file from disk.
   * @param path Path to the file
   * @return true on success, false on error
   */
  bool read(const std::string& path);

  /**
   * @brief Read from raw bytes.
   * @param data File contents
   * @return true on success, false on error
   */
  bool read(const std::vector<uint8_t>& data);

  const ParsedMidi& getParsedMidi() const { return midi_; }

  /// @brief Error message if read() failed.
  const std::string& getError() const { return error_; }

 private:
  bool parseHeader(const uint8_t* data, size_t size);
  bool parseTrack(const uint8_t* data, size_t size);

  ParsedMidi midi_;
  std::string error_;
  bool tempo_seen_ = false;
};

}  // namespace moira

#endif  // MOIRA_MIDI_READER_H
