/**
 * @file piece_parser.cpp
 * @brief Implementation of the JSON score reader.
 */

#include "io/piece_parser.h"

#include <fstream>
#include <sstream>

#include "midi/byte_order.h"

namespace moira {

namespace {

// Degrees further than this from the tonic leave MIDI range in any scale.
constexpr int64_t kMaxDegreeMagnitude = 1000;

// Last tick a voice may reach: the largest delta time an SMF event can carry
// from the start of its track.
constexpr uint64_t kMaxTick = kMaxVariableLength;

bool parseUnsigned(const std::string& text, size_t begin, size_t end, uint32_t& value) {
  if (begin >= end) return false;
  uint64_t result = 0;
  for (size_t i = begin; i < end; ++i) {
    char c = text[i];
    if (c < '0' || c > '9') return false;
    result = result * 10 + static_cast<uint64_t>(c - '0');
    if (result > kMaxTick) return false;
  }
  value = static_cast<uint32_t>(result);
  return true;
}

std::string quoted(const std::string& s) { return "\"" + s + "\""; }

}  // namespace

bool parseDurationSpec(const std::string& key, uint32_t& numerator, uint32_t& denominator) {
  numerator = 1;
  denominator = 1;

  size_t slash = key.find('/');
  size_t num_end = slash == std::string::npos ? key.size() : slash;

  if (num_end > 0 && !parseUnsigned(key, 0, num_end, numerator)) return false;
  if (slash != std::string::npos) {
    if (!parseUnsigned(key, slash + 1, key.size(), denominator)) return false;
    if (denominator == 0) return false;
  }
  return true;
}

bool PieceParser::fail(const std::string& message) {
  error_ = context_ + message;
  return false;
}

bool PieceParser::parseFile(const std::string& path, Piece& piece) {
  std::ifstream file(path);
  if (!file) {
    error_ = "Failed to open file: " + path;
    return false;
  }
  std::ostringstream oss;
  oss << file.rdbuf();
  return parse(oss.str(), piece);
}

bool PieceParser::parse(const std::string& json_text, Piece& piece) {
  error_.clear();
  warnings_.clear();
  context_.clear();

  json::Value doc;
  json::Parser parser(json_text);
  if (!parser.parse(doc)) {
    return fail("Could not parse JSON: " + parser.error());
  }
  if (!doc.isObject()) return fail("JSON should be an object");

  const json::Value* bpm = doc.find("bpm");
  if (!bpm) return fail("bpm missing");
  if (!bpm->isInteger() || bpm->asInt() < 1 || bpm->asInt() > 255) {
    return fail("bpm must be an integer between 1 and 255");
  }

  const json::Value* tracks = doc.find("tracks");
  if (!tracks) return fail("tracks missing");
  if (!tracks->isArray()) return fail("tracks should be an array");

  Piece result;
  result.bpm = static_cast<uint16_t>(bpm->asInt());

  const auto& track_list = tracks->asArray();
  for (size_t i = 0; i < track_list.size(); ++i) {
    context_ = "track " + std::to_string(i) + ": ";
    Voice voice;
    if (!parseTrack(track_list[i], result, voice)) return false;
    result.voices.push_back(std::move(voice));
  }

  context_.clear();
  piece = std::move(result);
  return true;
}

bool PieceParser::parseTrack(const json::Value& track_json, const Piece& piece, Voice& voice) {
  if (!track_json.isObject()) return fail("each track should be a JSON object");

  const json::Value* id = track_json.find("id");
  if (!id) return fail("id missing");
  if (!id->isString()) return fail("id should be a string");
  voice.id = id->asString();
  if (piece.findVoice(voice.id)) return fail("duplicate track id " + quoted(voice.id));

  // From here on errors name the track.
  context_ = context_.substr(0, context_.size() - 2) + " (" + quoted(voice.id) + "): ";

  const json::Value* scale = track_json.find("scale");
  if (!scale) return fail("scale missing");
  if (!parseScale(*scale, voice.scale)) return false;
  for (const auto& warning : voice.scale.warnings()) {
    warnings_.push_back(context_ + warning);
  }

  const json::Value* octave = track_json.find("octave");
  if (!octave) return fail("octave missing");
  if (!octave->isInteger()) return fail("octave should be an integer");
  if (octave->asInt() < -1 || octave->asInt() > 9) return fail("octave must be between -1 and 9");
  voice.octave = static_cast<int8_t>(octave->asInt());

  const json::Value* start = track_json.find("start");
  if (!start) return fail("start missing");
  if (!parseStart(*start, piece, voice.start)) return false;

  if (!parseOptionalByte(track_json, "program", 0, 127, voice.program)) return false;
  if (!parseOptionalByte(track_json, "velocity", 1, 127, voice.velocity)) return false;

  const json::Value* notes = track_json.find("notes");
  if (!notes) return fail("notes missing");
  if (!parseNotes(*notes, voice, TICKS_PER_BEAT, false, voice.notes)) return false;

  uint64_t end = voice.start;
  for (const auto& note : voice.notes) {
    end += note.duration;
  }
  if (end > kMaxTick) {
    return fail("notes end at tick " + std::to_string(end) + ", past the last tick " +
                std::to_string(kMaxTick));
  }
  return true;
}

bool PieceParser::parseScale(const json::Value& scale_json, Scale& scale) {
  if (scale_json.isString()) {
    ScaleResult result = parseScaleName(scale_json.asString());
    if (!result.ok()) return fail(result.error);
    scale = std::move(*result.scale);
    return true;
  }

  if (!scale_json.isObject()) return fail("scale should be a string or an object");

  const json::Value* key = scale_json.find("key");
  if (!key || !key->isString()) return fail("scale key should be a string");
  auto tonic = parseNamedKey(key->asString());
  if (!tonic) return fail("Invalid key: " + key->asString());

  const json::Value* offsets = scale_json.find("offsets");
  if (!offsets || !offsets->isArray()) return fail("scale offsets should be an array");

  std::vector<int8_t> values;
  for (const auto& offset : offsets->asArray()) {
    if (!offset.isInteger() || offset.asInt() < -128 || offset.asInt() > 127) {
      return fail("All offsets must be between 0 and 11!");
    }
    values.push_back(static_cast<int8_t>(offset.asInt()));
  }

  ScaleResult result = Scale::create(*tonic, values);
  if (!result.ok()) return fail(result.error);
  scale = std::move(*result.scale);
  return true;
}

bool PieceParser::parseStart(const json::Value& start_json, const Piece& piece, Tick& start) {
  if (start_json.isNumber()) {
    if (!start_json.isInteger() || start_json.asInt() < 0) {
      return fail("start should be a non-negative integer");
    }
    if (static_cast<uint64_t>(start_json.asInt()) > kMaxTick) {
      return fail("start " + std::to_string(start_json.asInt()) + " is past the last tick " +
                  std::to_string(kMaxTick));
    }
    start = static_cast<Tick>(start_json.asInt());
    return true;
  }

  if (!start_json.isObject()) return fail("start should be an integer or an object");

  const auto& members = start_json.asObject();
  if (members.empty()) return fail("start object is empty");
  if (members.size() > 1) return fail("start object must reference exactly one track");

  const auto& reference = members.front();
  const Voice* ref_voice = piece.findVoice(reference.key);
  if (!ref_voice) return fail("start references unknown track " + quoted(reference.key));
  if (!reference.value.isInteger()) return fail("offset to reference track must be an integer");

  int64_t offset = reference.value.asInt();
  int64_t resolved = static_cast<int64_t>(ref_voice->start) + offset;
  if (resolved < 0 || static_cast<uint64_t>(resolved) > kMaxTick) {
    return fail("start resolves to " + std::to_string(resolved) + ", outside the valid range");
  }
  start = static_cast<Tick>(resolved);
  return true;
}

bool PieceParser::parseOptionalByte(const json::Value& track_json, const char* key,
                                    int min_value, int max_value, std::optional<uint8_t>& out) {
  const json::Value* value = track_json.find(key);
  if (!value) return true;
  if (!value->isInteger() || value->asInt() < min_value || value->asInt() > max_value) {
    return fail(std::string(key) + " must be an integer between " + std::to_string(min_value) +
                " and " + std::to_string(max_value));
  }
  out = static_cast<uint8_t>(value->asInt());
  return true;
}

bool PieceParser::parseNotes(const json::Value& notes_json, const Voice& voice, Tick duration,
                             bool halve_array, std::vector<TimedNote>& notes) {
  switch (notes_json.type()) {
    case json::Value::Type::Number: {
      if (!notes_json.isInteger()) return fail("note value must be an integer");
      int64_t position = notes_json.asInt();
      if (position < -kMaxDegreeMagnitude || position > kMaxDegreeMagnitude ||
          !voice.scale.degreeMidiNote(static_cast<int>(position), voice.octave)) {
        return fail("note " + std::to_string(position) + " is outside MIDI range");
      }
      notes.push_back({static_cast<int>(position), duration});
      return true;
    }

    case json::Value::Type::String:
      if (!notes_json.asString().empty()) {
        return fail("only an empty string can be used to signify a silence");
      }
      notes.push_back({std::nullopt, duration});
      return true;

    case json::Value::Type::Null:
      notes.push_back({std::nullopt, duration});
      return true;

    case json::Value::Type::Array: {
      Tick element_duration = halve_array ? duration / 2 : duration;
      if (element_duration == 0) return fail("nested notes are shorter than one tick");
      for (const auto& element : notes_json.asArray()) {
        if (!parseNotes(element, voice, element_duration, true, notes)) return false;
      }
      return true;
    }

    case json::Value::Type::Object:
      for (const auto& member : notes_json.asObject()) {
        uint32_t numerator = 1;
        uint32_t denominator = 1;
        if (!parseDurationSpec(member.key, numerator, denominator)) {
          return fail("Invalid duration specifier: " + member.key);
        }
        uint64_t scaled = static_cast<uint64_t>(duration) * numerator / denominator;
        if (scaled == 0) return fail("duration " + member.key + " is shorter than one tick");
        if (scaled > kMaxTick) return fail("duration " + member.key + " is too long");
        if (!parseNotes(member.value, voice, static_cast<Tick>(scaled), false, notes)) {
          return false;
        }
      }
      return true;

    case json::Value::Type::Bool:
      break;
  }
  return fail("notes must be a number, string, null, array or object");
}

}  // namespace moira
