#ifndef MOIRA_MIDI_WRITER_H
#define MOIRA_MIDI_WRITER_H

#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/midi_track.h"
#include "core/piece.h"
#include "core/render_config.h"

namespace moira {

// A rendered voice ready to be written as one MTrk chunk.
struct OutputTrack {
  std::string name;
  uint8_t channel = 0;
  uint8_t program = DEFAULT_PROG;
  MidiTrack track;
};

// Writes MIDI data in SMF Type 1 format.
// This class only handles byte-level output; Voice::render does the musical part.
class MidiWriter {
 public:
  MidiWriter() = default;

  // Renders every voice of a piece and builds the file.
  // @param piece Piece to render
  // @param config Output settings (defaults, tempo override, transposition)
  // @param metadata Optional JSON metadata to embed as a text event
  // @returns false with error() set if a voice cannot be rendered; the
  //          data of the previous build is kept
  bool build(const Piece& piece, const RenderConfig& config, const std::string& metadata = "");

  // Builds the file from already rendered tracks.
  // @param tracks Tracks in output order (empty writes a tempo-only track)
  // @param bpm Tempo in beats per minute
  // @param metadata Optional JSON metadata to embed as a text event
  void buildTracks(const std::vector<OutputTrack>& tracks, uint16_t bpm,
                   const std::string& metadata = "");

  const std::string& error() const { return error_; }

  // Notes clamped into MIDI range by RenderConfig::transpose, one line per track.
  const std::vector<std::string>& warnings() const { return warnings_; }

  // Returns the MIDI data as a byte vector.
  std::vector<uint8_t> toBytes() const;

  // Writes MIDI data to a file.
  // @param path Output file path
  // @returns true on success, false on failure
  bool writeToFile(const std::string& path) const;

 private:
  std::vector<uint8_t> data_;
  std::string error_;
  std::vector<std::string> warnings_;

  // Writes the MIDI file header chunk.
  void writeHeader(uint16_t num_tracks, uint16_t division);

  // Writes a single track chunk. The first track also carries metadata,
  // tempo and time signature; a tempo-only track has no program change.
  void writeTrack(const OutputTrack& track, uint16_t bpm, bool is_first_track,
                  bool with_program, const std::string& metadata);
};

}  // namespace moira

#endif  // MOIRA_MIDI_WRITER_H
