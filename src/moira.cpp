/**
 * @file moira.cpp
 * @brief Implementation of the Moira API.
 */

#include "moira.h"

#include <sstream>

#include "core/json_helpers.h"
#include "io/piece_parser.h"
#include "midi/track_config.h"

namespace moira {

namespace {

// Metadata format version (increment when format changes incompatibly)
constexpr int kMetadataFormatVersion = 1;

}  // namespace

bool Moira::loadPiece(const std::string& json_text) {
  PieceParser parser;
  Piece loaded;
  if (!parser.parse(json_text, loaded)) {
    error_ = parser.error();
    return false;
  }
  error_.clear();
  load_warnings_ = parser.warnings();
  warnings_ = load_warnings_;
  piece_ = std::move(loaded);
  return true;
}

bool Moira::loadPieceFromFile(const std::string& path) {
  PieceParser parser;
  Piece loaded;
  if (!parser.parseFile(path, loaded)) {
    error_ = parser.error();
    return false;
  }
  error_.clear();
  load_warnings_ = parser.warnings();
  warnings_ = load_warnings_;
  piece_ = std::move(loaded);
  return true;
}

void Moira::setPiece(Piece piece) {
  piece_ = std::move(piece);
  error_.clear();
  load_warnings_.clear();
  for (const auto& voice : piece_.voices) {
    for (const auto& warning : voice.scale.warnings()) {
      load_warnings_.push_back("track \"" + voice.id + "\": " + warning);
    }
  }
  warnings_ = load_warnings_;
}

bool Moira::render(const RenderConfig& config) {
  std::string metadata = config.embed_metadata ? getMetadata(config) : "";
  if (!midi_writer_.build(piece_, config, metadata)) {
    error_ = midi_writer_.error();
    return false;
  }
  error_.clear();
  warnings_ = load_warnings_;
  for (const auto& warning : midi_writer_.warnings()) {
    warnings_.push_back(warning);
  }
  return true;
}

std::vector<uint8_t> Moira::getMidi() const { return midi_writer_.toBytes(); }

bool Moira::writeMidi(const std::string& path) {
  if (!midi_writer_.writeToFile(path)) {
    error_ = "Failed to write file: " + path;
    return false;
  }
  return true;
}

std::string Moira::getMetadata(const RenderConfig& config) const {
  std::ostringstream oss;
  json::Writer w(oss);
  uint16_t bpm = config.bpm_override != 0 ? config.bpm_override : piece_.bpm;

  w.beginObject()
      .write("generator", "moira")
      .write("format_version", kMetadataFormatVersion)
      .write("library_version", version())
      .write("bpm", bpm)
      .write("transpose", static_cast<int>(config.transpose))
      .beginArray("tracks");

  for (const auto& voice : piece_.voices) {
    w.beginObject()
        .write("id", voice.id)
        .write("scale", voice.scale.name())
        .write("octave", static_cast<int>(voice.octave))
        .write("start", voice.start)
        .endObject();
  }

  w.endArray().endObject();
  return oss.str();
}

std::string Moira::getPieceJson(const RenderConfig& config, bool pretty) const {
  std::ostringstream oss;
  json::Writer w(oss, pretty);
  uint16_t bpm = config.bpm_override != 0 ? config.bpm_override : piece_.bpm;

  w.beginObject()
      .write("bpm", bpm)
      .write("division", TICKS_PER_BEAT)
      .write("duration_ticks", piece_.endTick())
      .beginArray("tracks");

  for (size_t i = 0; i < piece_.voices.size(); ++i) {
    const Voice& voice = piece_.voices[i];
    w.beginObject()
        .write("id", voice.id)
        .write("scale", voice.scale.name())
        .beginArray("degrees");
    for (const auto& key : voice.scale.degrees()) {
      w.value(key.toString());
    }
    w.endArray()
        .write("octave", static_cast<int>(voice.octave))
        .write("start", voice.start)
        .write("end", voice.endTick())
        .write("channel", static_cast<int>(channelForTrack(i)))
        .write("program", static_cast<int>(voice.program.value_or(config.default_program)))
        .write("velocity", static_cast<int>(voice.velocity.value_or(config.default_velocity)))
        .beginArray("notes");

    Tick tick = voice.start;
    for (const auto& note : voice.notes) {
      w.beginObject().write("tick", tick).write("duration", note.duration);
      if (note.isRest()) {
        w.write("rest", true);
      } else {
        w.write("degree", *note.position);
        auto named = voice.scale.degreeNote(*note.position, voice.octave);
        if (named) {
          w.write("name", named->toString()).write("midi", named->midiValue());
        }
      }
      w.endObject();
      tick += note.duration;
    }

    w.endArray().endObject();
  }

  w.endArray().endObject();
  return oss.str();
}

const char* Moira::version() { return "0.1.0"; }

}  // namespace moira
