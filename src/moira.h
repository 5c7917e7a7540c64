/**
 * @file moira.h
 * @brief High-level API: load a JSON score and render it to MIDI.
 */

#ifndef MOIRA_H
#define MOIRA_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/piece.h"
#include "core/render_config.h"
#include "midi/midi_writer.h"

namespace moira {

/// @brief High-level API wrapping PieceParser and MidiWriter.
class Moira {
 public:
  Moira() = default;

  /**
   * @brief Load a score from JSON text.
   * @param json_text Score document
   * @return false with error() set if the score is invalid
   */
  bool loadPiece(const std::string& json_text);

  /// @brief Load a score from a JSON file.
  bool loadPieceFromFile(const std::string& path);

  /// @brief Replace the current piece with one built in code.
  void setPiece(Piece piece);

  /**
   * @brief Render the loaded piece to MIDI.
   * @param config Output settings
   * @return false with error() set if a voice leaves MIDI range
   */
  bool render(const RenderConfig& config = RenderConfig());

  /**
   * @brief Get MIDI data as byte vector.
   * @return SMF data of the last successful render()
   */
  std::vector<uint8_t> getMidi() const;

  /**
   * @brief Write the rendered MIDI data to a file.
   * @return false with error() set on I/O failure
   */
  bool writeMidi(const std::string& path);

  /**
   * @brief Get the resolved piece as JSON.
   *
   * Every note with its absolute tick, spelled name and MIDI number, using
   * the defaults of @p config for tracks that set no program or velocity.
   */
  std::string getPieceJson(const RenderConfig& config = RenderConfig(), bool pretty = true) const;

  /// @brief Metadata embedded in the MIDI file by render().
  std::string getMetadata(const RenderConfig& config) const;

  const Piece& piece() const { return piece_; }

  const std::string& error() const { return error_; }

  /// @brief Warnings from loading and rendering, one line each.
  const std::vector<std::string>& warnings() const { return warnings_; }

  /**
   * @brief Get library version string.
   * @return Version string (e.g., "0.1.0")
   */
  static const char* version();

 private:
  Piece piece_;
  MidiWriter midi_writer_;
  std::string error_;
  std::vector<std::string> load_warnings_;
  std::vector<std::string> warnings_;
};

}  // namespace moira

#endif  // MOIRA_H
