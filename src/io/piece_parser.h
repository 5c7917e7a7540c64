/**
 * @file piece_parser.h
 * @brief Reads the JSON score format into a Piece.
 */

#ifndef MOIRA_IO_PIECE_PARSER_H
#define MOIRA_IO_PIECE_PARSER_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/json_helpers.h"
#include "core/piece.h"

namespace moira {

/**
 * @brief Parse a duration key of a notes object.
 *
 * Accepts "n", "n/d", "/d" and "" (n and d default to 1).
 * @return false if @p key does not match or the denominator is zero
 */
bool parseDurationSpec(const std::string& key, uint32_t& numerator, uint32_t& denominator);

/**
 * @brief JSON score reader.
 *
 * Format:
 * ```
 * Piece  = { "bpm": uint, "tracks": [ Track* ] }
 * Track  = { "id": string, "scale": ScaleSpec, "octave": int, "start": Start,
 *            "notes": Notes, ["program": int], ["velocity": int] }
 * ScaleSpec = string | { "key": string, "offsets": [int*] }
 * Start  = uint | { <earlier track id>: offset<int> }
 * Notes  = Note | [ Notes* ] | { Duration: Notes, ... }
 * Note   = int | null | ""
 * ```
 *
 * Top-level notes last one beat. Each array nested inside another array
 * halves the duration of its elements; a duration object scales it by n/d.
 */
class PieceParser {
 public:
  PieceParser() = default;

  /**
   * @brief Parse a score from JSON text.
   * @param json_text Score document
   * @param piece Receives the piece on success
   * @return false with error() set on failure
   */
  bool parse(const std::string& json_text, Piece& piece);

  /// @brief Read and parse a score file.
  bool parseFile(const std::string& path, Piece& piece);

  const std::string& error() const { return error_; }

  /// @brief Non-fatal issues (scale spelling fallbacks), one line each.
  const std::vector<std::string>& warnings() const { return warnings_; }

 private:
  bool parseTrack(const json::Value& track_json, const Piece& piece, Voice& voice);
  bool parseScale(const json::Value& scale_json, Scale& scale);
  bool parseStart(const json::Value& start_json, const Piece& piece, Tick& start);
  bool parseNotes(const json::Value& notes_json, const Voice& voice, Tick duration,
                  bool halve_array, std::vector<TimedNote>& notes);
  bool parseOptionalByte(const json::Value& track_json, const char* key, int min_value,
                         int max_value, std::optional<uint8_t>& out);

  bool fail(const std::string& message);

  std::string error_;
  std::vector<std::string> warnings_;
  std::string context_;  // "track N (\"id\"): " while a track is parsed
};

}  // namespace moira

#endif  // MOIRA_IO_PIECE_PARSER_H
