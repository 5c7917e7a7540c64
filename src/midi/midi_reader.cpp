/**
 * @file midi_reader.cpp
 * @brief Implementation of the SMF parser.
 */

#include "midi/midi_reader.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <iterator>
#include <map>
#include <utility>

#include "midi/byte_order.h"

namespace moira {

namespace {

constexpr const char* kMetadataPrefix = "MOIRA:";

constexpr uint8_t kMetaText = 0x01;
constexpr uint8_t kMetaTrackName = 0x03;
constexpr uint8_t kMetaEndOfTrack = 0x2F;
constexpr uint8_t kMetaTempo = 0x51;

bool sameNameIgnoringCase(const std::string& a, const std::string& b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

// Data bytes following a channel status (0x80-0xEF).
size_t channelDataLength(uint8_t status) {
  switch (status & 0xF0) {
    case 0xC0:
    case 0xD0:
      return 1;
    default:
      return 2;
  }
}

// Notes sounding in one track, keyed by (channel << 8) | pitch.
class NoteTracker {
 public:
  void noteOn(uint8_t channel, uint8_t pitch, uint8_t velocity, Tick now,
              std::vector<NoteEvent>& out) {
    noteOff(channel, pitch, now, out);  // a repeated note-on ends the sounding note
    if (velocity > 0) sounding_[key(channel, pitch)] = {now, velocity};
  }

  void noteOff(uint8_t channel, uint8_t pitch, Tick now, std::vector<NoteEvent>& out) {
    auto it = sounding_.find(key(channel, pitch));
    if (it == sounding_.end()) return;
    out.emplace_back(it->second.first, now - it->second.first, pitch, it->second.second);
    sounding_.erase(it);
  }

  void closeAll(Tick now, std::vector<NoteEvent>& out) {
    for (const auto& [k, start] : sounding_) {
      out.emplace_back(start.first, now - start.first, static_cast<uint8_t>(k & 0xFF),
                       start.second);
    }
    sounding_.clear();
  }

 private:
  static uint16_t key(uint8_t channel, uint8_t pitch) {
    return static_cast<uint16_t>((channel << 8) | pitch);
  }

  std::map<uint16_t, std::pair<Tick, uint8_t>> sounding_;
};

}  // namespace

const ParsedTrack* ParsedMidi::getTrack(const std::string& name) const {
  auto it = std::find_if(tracks.begin(), tracks.end(), [&name](const ParsedTrack& track) {
    return sameNameIgnoringCase(track.name, name);
  });
  return it == tracks.end() ? nullptr : &*it;
}

bool MidiReader::read(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error_ = "Failed to open file: " + path;
    return false;
  }

  std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
  if (file.bad()) {
    error_ = "Failed to read file: " + path;
    return false;
  }
  return read(data);
}

bool MidiReader::read(const std::vector<uint8_t>& data) {
  midi_ = ParsedMidi{};
  error_.clear();
  tempo_seen_ = false;

  if (data.size() < 14) {
    error_ = "File too small for MIDI header";
    return false;
  }
  if (!parseHeader(data.data(), data.size())) return false;

  // Chunks follow the header; trailing bytes shorter than a chunk header are ignored.
  size_t pos = 8 + readUint32BE(&data[4]);
  while (data.size() - pos >= 8) {
    if (std::memcmp(&data[pos], "MTrk", 4) != 0) {
      error_ = "Expected MTrk chunk at offset " + std::to_string(pos);
      return false;
    }
    uint32_t length = readUint32BE(&data[pos + 4]);
    pos += 8;
    if (length > data.size() - pos) {
      error_ = "Track data exceeds file size";
      return false;
    }
    if (!parseTrack(&data[pos], length)) return false;
    pos += length;
  }
  return true;
}

bool MidiReader::parseHeader(const uint8_t* data, size_t size) {
  if (std::memcmp(data, "MThd", 4) != 0) {
    error_ = "Invalid MIDI header (expected MThd)";
    return false;
  }

  uint32_t length = readUint32BE(data + 4);
  if (length < 6 || length > size - 8) {
    error_ = "Invalid header chunk size";
    return false;
  }

  midi_.format = readUint16BE(data + 8);
  midi_.num_tracks = readUint16BE(data + 10);
  midi_.division = readUint16BE(data + 12);
  if (midi_.format > 1) {
    error_ = "Unsupported SMF format " + std::to_string(midi_.format);
    return false;
  }
  return true;
}

bool MidiReader::parseTrack(const uint8_t* data, size_t size) {
  const std::string track_label = "track " + std::to_string(midi_.tracks.size());
  ParsedTrack track;
  NoteTracker tracker;
  Tick now = 0;
  uint8_t running_status = 0;
  size_t pos = 0;

  while (pos < size) {
    uint32_t delta = 0;
    if (!readVariableLength(data, pos, size, delta)) {
      error_ = "Truncated delta time in " + track_label;
      return false;
    }
    now += delta;
    if (pos >= size) break;

    uint8_t status = data[pos];
    if (status & 0x80) {
      ++pos;
      if (status < 0xF0) running_status = status;
    } else if (running_status != 0) {
      status = running_status;
    } else {
      error_ = "Data byte without status in " + track_label;
      return false;
    }

    if (status == 0xFF) {
      if (pos >= size) break;
      uint8_t meta_type = data[pos++];
      uint32_t length = 0;
      if (!readVariableLength(data, pos, size, length) || length > size - pos) {
        error_ = "Truncated meta event in " + track_label;
        return false;
      }
      std::string payload(reinterpret_cast<const char*>(data + pos), length);
      pos += length;

      switch (meta_type) {
        case kMetaText:
          if (payload.rfind(kMetadataPrefix, 0) == 0) {
            midi_.metadata = payload.substr(std::strlen(kMetadataPrefix));
          }
          break;
        case kMetaTrackName:
          track.name = payload;
          break;
        case kMetaTempo:
          if (length == 3 && !tempo_seen_) {
            uint32_t usec = (static_cast<uint32_t>(static_cast<uint8_t>(payload[0])) << 16) |
                            (static_cast<uint32_t>(static_cast<uint8_t>(payload[1])) << 8) |
                            static_cast<uint8_t>(payload[2]);
            if (usec > 0) {
              // Round to the nearest BPM; 60000000 / bpm truncates on write
              midi_.bpm = static_cast<uint16_t>((kMicrosecondsPerMinute + usec / 2) / usec);
              tempo_seen_ = true;
            }
          }
          break;
        case kMetaEndOfTrack:
          pos = size;
          break;
        default:
          break;
      }
      continue;
    }

    if (status == 0xF0 || status == 0xF7) {
      uint32_t length = 0;
      if (!readVariableLength(data, pos, size, length)) {
        error_ = "Truncated SysEx in " + track_label;
        return false;
      }
      pos += length;
      continue;
    }

    if (status >= 0xF0) continue;  // System common/real-time: no data to read here

    size_t data_length = channelDataLength(status);
    if (size - pos < data_length) break;
    uint8_t channel = status & 0x0F;
    uint8_t d1 = data[pos];
    uint8_t d2 = data_length > 1 ? data[pos + 1] : 0;
    pos += data_length;

    switch (status & 0xF0) {
      case 0x80:
        tracker.noteOff(channel, d1, now, track.notes);
        track.channel = channel;
        break;
      case 0x90:
        tracker.noteOn(channel, d1, d2, now, track.notes);
        track.channel = channel;
        break;
      case 0xC0:
        track.program = d1;
        track.channel = channel;
        break;
      default:
        break;  // Pressure, controllers and pitch bend carry no note data
    }
  }

  tracker.closeAll(now, track.notes);
  std::stable_sort(track.notes.begin(), track.notes.end(),
                   [](const NoteEvent& a, const NoteEvent& b) {
                     return a.start_tick < b.start_tick;
                   });

  midi_.tracks.push_back(std::move(track));
  return true;
}

}  // namespace moira
