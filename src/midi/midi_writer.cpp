/**
 * @file midi_writer.cpp
 * @brief Implementation of the SMF Type 1 file writer.
 */

#include "midi/midi_writer.h"

#include <fstream>

#include "midi/byte_order.h"
#include "midi/track_config.h"

namespace moira {

// Track names are kept to 255 bytes for compatibility with most software.
constexpr size_t kMaxMetaTextLength = 255;

// Prefix of the text event carrying generation metadata.
constexpr const char* kMetadataPrefix = "MOIRA:";

namespace {

void writeMetaText(std::vector<uint8_t>& buf, uint8_t meta_type, const std::string& text) {
  buf.push_back(0x00);
  buf.push_back(0xFF);
  buf.push_back(meta_type);
  writeVariableLength(buf, static_cast<uint32_t>(text.size()));
  for (char c : text) {
    buf.push_back(static_cast<uint8_t>(c));
  }
}

}  // namespace

void MidiWriter::writeHeader(uint16_t num_tracks, uint16_t division) {
  data_.push_back('M');
  data_.push_back('T');
  data_.push_back('h');
  data_.push_back('d');

  // Header length = 6
  writeUint32BE(data_, 6);

  // Format = 1
  writeUint16BE(data_, 1);

  writeUint16BE(data_, num_tracks);

  // Division (ticks per quarter note)
  writeUint16BE(data_, division);
}

void MidiWriter::writeTrack(const OutputTrack& track, uint16_t bpm, bool is_first_track,
                            bool with_program, const std::string& metadata) {
  std::vector<uint8_t> track_data;

  // Track name (Meta event 0x03)
  std::string track_name = track.name.size() > kMaxMetaTextLength
                               ? track.name.substr(0, kMaxMetaTextLength)
                               : track.name;
  writeMetaText(track_data, 0x03, track_name);

  if (is_first_track) {
    // Generation metadata as Text Event (0xFF 0x01)
    if (!metadata.empty()) {
      writeMetaText(track_data, 0x01, kMetadataPrefix + metadata);
    }

    // Tempo
    uint32_t microseconds_per_beat = kMicrosecondsPerMinute / bpm;
    track_data.push_back(0x00);
    track_data.push_back(0xFF);
    track_data.push_back(0x51);
    track_data.push_back(0x03);
    track_data.push_back((microseconds_per_beat >> 16) & 0xFF);
    track_data.push_back((microseconds_per_beat >> 8) & 0xFF);
    track_data.push_back(microseconds_per_beat & 0xFF);

    // Time signature 4/4
    track_data.push_back(0x00);
    track_data.push_back(0xFF);
    track_data.push_back(0x58);
    track_data.push_back(0x04);
    track_data.push_back(0x04);  // Numerator
    track_data.push_back(0x02);  // Denominator (power of 2)
    track_data.push_back(0x18);  // Clocks per metronome click
    track_data.push_back(0x08);  // 32nd notes per quarter
  }

  if (with_program) {
    track_data.push_back(0x00);
    track_data.push_back(0xC0 | (track.channel & 0x0F));
    track_data.push_back(track.program & 0x7F);
  }

  // Events come sorted with note-off before note-on at the same tick
  Tick prev_time = 0;
  for (const auto& evt : track.track.toMidiEvents(track.channel)) {
    writeVariableLength(track_data, evt.tick - prev_time);
    prev_time = evt.tick;

    track_data.push_back(evt.status);
    track_data.push_back(evt.data1);
    track_data.push_back(evt.data2);
  }

  // End of track
  track_data.push_back(0x00);
  track_data.push_back(0xFF);
  track_data.push_back(0x2F);
  track_data.push_back(0x00);

  data_.push_back('M');
  data_.push_back('T');
  data_.push_back('r');
  data_.push_back('k');
  writeUint32BE(data_, static_cast<uint32_t>(track_data.size()));

  data_.insert(data_.end(), track_data.begin(), track_data.end());
}

void MidiWriter::buildTracks(const std::vector<OutputTrack>& tracks, uint16_t bpm,
                             const std::string& metadata) {
  data_.clear();

  // A zero tempo has no microsecond value
  if (bpm == 0) bpm = 120;

  if (tracks.empty()) {
    writeHeader(1, TICKS_PER_BEAT);
    OutputTrack tempo_track;
    tempo_track.name = "Tempo";
    writeTrack(tempo_track, bpm, true, false, metadata);
    return;
  }

  writeHeader(static_cast<uint16_t>(tracks.size()), TICKS_PER_BEAT);
  for (size_t i = 0; i < tracks.size(); ++i) {
    writeTrack(tracks[i], bpm, i == 0, true, metadata);
  }
}

bool MidiWriter::build(const Piece& piece, const RenderConfig& config,
                       const std::string& metadata) {
  error_.clear();
  warnings_.clear();

  // data_ keeps the previous file until every voice has rendered
  if (piece.voices.size() > 0xFFFF) {
    error_ = "Too many tracks for a MIDI file: " + std::to_string(piece.voices.size());
    return false;
  }

  std::vector<OutputTrack> tracks;
  tracks.reserve(piece.voices.size());

  for (size_t i = 0; i < piece.voices.size(); ++i) {
    const Voice& voice = piece.voices[i];

    OutputTrack out;
    out.name = voice.id;
    out.channel = channelForTrack(i);
    out.program = voice.program.value_or(config.default_program);
    if (!voice.render(config.default_velocity, out.track, error_)) {
      return false;
    }

    if (config.transpose != 0) {
      size_t clamped = out.track.transpose(config.transpose);
      if (clamped > 0) {
        warnings_.push_back("Voice " + voice.id + ": " + std::to_string(clamped) +
                            " note(s) clamped to MIDI range after transposing by " +
                            std::to_string(config.transpose));
      }
    }
    tracks.push_back(std::move(out));
  }

  uint16_t bpm = config.bpm_override != 0 ? config.bpm_override : piece.bpm;
  buildTracks(tracks, bpm, metadata);
  return true;
}

std::vector<uint8_t> MidiWriter::toBytes() const { return data_; }

bool MidiWriter::writeToFile(const std::string& path) const {
  std::ofstream file(path, std::ios::binary);
  if (!file) return false;

  file.write(reinterpret_cast<const char*>(data_.data()),
             static_cast<std::streamsize>(data_.size()));
  return file.good();
}

}  // namespace moira
