/**
 * @file cli_main.cpp
 * @brief Command-line interface: render JSON scores to MIDI and inspect scales and files.
 */

#include "moira.h"
#include "core/chord.h"
#include "core/json_helpers.h"
#include "core/scale.h"
#include "midi/midi_reader.h"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>

namespace {

void printUsage(const char* program) {
  std::cout << "Usage: " << program << " [options] SCORE.json\n\n";
  std::cout << "Options:\n";
  std::cout << "  -o, --output FILE  Output MIDI file (default: SCORE with .mid extension)\n";
  std::cout << "  --bpm N            Override the piece tempo (1-255)\n";
  std::cout << "  --program N        Default GM program for tracks without one (0-127, default 6)\n";
  std::cout << "  --velocity N       Default note velocity (1-127, default 127)\n";
  std::cout << "  --transpose N      Transpose all output by N semitones (-127..127)\n";
  std::cout << "  --no-metadata      Do not embed MOIRA: metadata\n";
  std::cout << "  --print-notes      Print spelled notes of each track\n";
  std::cout << "  --dump             Print the resolved piece as JSON\n";
  std::cout << "  --scale NAME       Print the spelling of a scale and exit (e.g. Ebharm)\n";
  std::cout << "  --chords NAME      Print the diatonic triads and sevenths of a scale and exit\n";
  std::cout << "  --inspect FILE     Print the contents of a MIDI file and exit\n";
  std::cout << "  --json             JSON output for --inspect and --scale\n";
  std::cout << "  --unicode          Use Unicode accidentals when printing note names\n";
  std::cout << "  -h, --help         Show this help message\n";
}

// Parse a decimal integer argument within [min_value, max_value].
bool parseIntArg(const char* option, const char* text, long min_value, long max_value,
                 long& value) {
  char* end = nullptr;
  errno = 0;
  long parsed = std::strtol(text, &end, 10);
  if (end == text || *end != '\0' || errno == ERANGE || parsed < min_value ||
      parsed > max_value) {
    std::cerr << "Error: " << option << " expects an integer between " << min_value << " and "
              << max_value << ", got '" << text << "'\n";
    return false;
  }
  value = parsed;
  return true;
}

std::string defaultOutputPath(const std::string& score_path) {
  const std::string ext = ".json";
  if (score_path.size() > ext.size() &&
      score_path.compare(score_path.size() - ext.size(), ext.size(), ext) == 0) {
    return score_path.substr(0, score_path.size() - ext.size()) + ".mid";
  }
  return score_path + ".mid";
}

std::string noteName(uint8_t midi, moira::AccidentalStyle style) {
  return moira::Note(midi).defaultSpelling().toString(style);
}

void printWarnings(const std::vector<std::string>& warnings) {
  for (const auto& warning : warnings) {
    std::cerr << "Warning: " << warning << "\n";
  }
}

int printScale(const std::string& name, bool json_output, moira::AccidentalStyle style) {
  moira::ScaleResult result = moira::parseScaleName(name);
  if (!result.ok()) {
    std::cerr << "Error: " << result.error << "\n";
    return 1;
  }
  const moira::Scale& scale = *result.scale;

  if (json_output) {
    moira::json::Writer w(std::cout, true);
    w.beginObject()
        .write("name", scale.name())
        .write("type", moira::scaleTypeName(scale.type()))
        .write("tonic", scale.tonic().toString(style))
        .beginArray("offsets");
    for (int8_t offset : scale.offsets()) w.value(static_cast<int>(offset));
    w.endArray().beginArray("degrees");
    for (const auto& key : scale.degrees()) w.value(key.toString(style));
    w.endArray().beginArray("warnings");
    for (const auto& warning : scale.warnings()) w.value(warning);
    w.endArray().endObject();
    std::cout << "\n";
    return 0;
  }

  std::cout << scale.name() << " (" << moira::scaleTypeName(scale.type()) << "):";
  for (const auto& key : scale.degrees()) {
    std::cout << " " << key.toString(style);
  }
  std::cout << "\n";
  printWarnings(scale.warnings());
  return 0;
}

void printChordRow(const moira::Chord& chord, moira::AccidentalStyle style) {
  std::cout << "  " << std::left << std::setw(8) << chord.romanNumeral(style) << std::setw(10)
            << chord.symbol(style);
  for (size_t i = 0; i < chord.notes().size(); ++i) {
    if (i > 0) std::cout << " ";
    std::cout << chord.notes()[i].toString(style);
  }
  std::cout << "  (" << moira::chordQualityName(chord.quality()) << ")\n";
}

int printChords(const std::string& name, moira::AccidentalStyle style) {
  moira::ScaleResult result = moira::parseScaleName(name);
  if (!result.ok()) {
    std::cerr << "Error: " << result.error << "\n";
    return 1;
  }
  const moira::Scale& scale = *result.scale;
  printWarnings(scale.warnings());

  std::string error;
  auto triads = moira::diatonicChords(scale, 4, moira::ChordSize::Triad, &error);
  if (triads.empty()) {
    std::cerr << "Error: " << error << "\n";
    return 1;
  }
  auto sevenths = moira::diatonicChords(scale, 4, moira::ChordSize::Seventh, &error);
  if (sevenths.empty()) {
    std::cerr << "Error: " << error << "\n";
    return 1;
  }

  std::cout << scale.name() << " triads:\n";
  for (const auto& chord : triads) printChordRow(chord, style);
  std::cout << "\n" << scale.name() << " sevenths:\n";
  for (const auto& chord : sevenths) printChordRow(chord, style);
  return 0;
}

int inspectMidi(const std::string& path, bool json_output, moira::AccidentalStyle style) {
  moira::MidiReader reader;
  if (!reader.read(path)) {
    std::cerr << "Error: " << reader.getError() << "\n";
    return 1;
  }
  const auto& midi = reader.getParsedMidi();

  if (json_output) {
    moira::json::Writer w(std::cout, true);
    w.beginObject()
        .write("format", midi.format)
        .write("num_tracks", midi.num_tracks)
        .write("division", midi.division)
        .write("bpm", midi.bpm);
    if (midi.hasMoiraMetadata()) {
      w.write("metadata", midi.metadata);
    } else {
      w.writeNull("metadata");
    }
    w.beginArray("tracks");
    for (const auto& track : midi.tracks) {
      w.beginObject()
          .write("name", track.name)
          .write("channel", static_cast<int>(track.channel))
          .write("program", track.program)
          .beginArray("notes");
      for (const auto& note : track.notes) {
        w.beginObject()
            .write("tick", note.start_tick)
            .write("duration", note.duration)
            .write("pitch", static_cast<int>(note.note))
            .write("name", noteName(note.note, style))
            .write("velocity", static_cast<int>(note.velocity))
            .endObject();
      }
      w.endArray().endObject();
    }
    w.endArray().endObject();
    std::cout << "\n";
    return 0;
  }

  std::cout << "File: " << path << "\n";
  std::cout << "Format: SMF" << midi.format << ", " << midi.tracks.size() << " track(s), "
            << midi.division << " ticks/beat, " << midi.bpm << " BPM\n";
  if (midi.hasMoiraMetadata()) {
    std::cout << "Metadata: " << midi.metadata << "\n";
  }
  for (size_t i = 0; i < midi.tracks.size(); ++i) {
    const auto& track = midi.tracks[i];
    std::cout << "\nTrack " << i << " \"" << track.name << "\": channel "
              << static_cast<int>(track.channel);
    if (track.program >= 0) std::cout << ", program " << track.program;
    std::cout << ", " << track.notes.size() << " note(s)\n";
    for (const auto& note : track.notes) {
      std::cout << "  " << std::right << std::setw(6) << note.start_tick << " +" << std::left
                << std::setw(5) << note.duration << std::setw(5) << noteName(note.note, style)
                << "(" << static_cast<int>(note.note) << ") vel "
                << static_cast<int>(note.velocity) << "\n";
    }
  }
  return 0;
}

void printNotes(const moira::Piece& piece, moira::AccidentalStyle style) {
  for (const auto& voice : piece.voices) {
    std::cout << voice.id << " (" << voice.scale.name() << ", octave "
              << static_cast<int>(voice.octave) << ", start " << voice.start << "):";
    for (const auto& note : voice.namedNotes()) {
      std::cout << " " << note.toString(style);
    }

    // Range of the sounding pitches; render errors are reported by Moira::render()
    moira::MidiTrack track;
    std::string error;
    if (voice.render(moira::DEFAULT_VELOCITY, track, error) && !track.empty()) {
      auto [low, high] = track.analyzeRange();
      std::cout << "  [" << noteName(low, style) << " - " << noteName(high, style) << "]";
    }
    std::cout << "\n";
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string score_file;
  std::string output_file;
  std::string scale_name;   // --scale
  std::string chords_name;  // --chords
  std::string inspect_file;
  bool json_output = false;
  bool print_notes = false;
  bool dump = false;
  moira::AccidentalStyle style = moira::AccidentalStyle::Ascii;
  moira::RenderConfig config;

  for (int i = 1; i < argc; ++i) {
    long value = 0;
    if ((std::strcmp(argv[i], "-o") == 0 || std::strcmp(argv[i], "--output") == 0) &&
        i + 1 < argc) {
      output_file = argv[++i];
    } else if (std::strcmp(argv[i], "--bpm") == 0 && i + 1 < argc) {
      if (!parseIntArg("--bpm", argv[++i], 1, 255, value)) return 1;
      config.bpm_override = static_cast<uint16_t>(value);
    } else if (std::strcmp(argv[i], "--program") == 0 && i + 1 < argc) {
      if (!parseIntArg("--program", argv[++i], 0, 127, value)) return 1;
      config.default_program = static_cast<uint8_t>(value);
    } else if (std::strcmp(argv[i], "--velocity") == 0 && i + 1 < argc) {
      if (!parseIntArg("--velocity", argv[++i], 1, 127, value)) return 1;
      config.default_velocity = static_cast<uint8_t>(value);
    } else if (std::strcmp(argv[i], "--transpose") == 0 && i + 1 < argc) {
      if (!parseIntArg("--transpose", argv[++i], -127, 127, value)) return 1;
      config.transpose = static_cast<int8_t>(value);
    } else if (std::strcmp(argv[i], "--no-metadata") == 0) {
      config.embed_metadata = false;
    } else if (std::strcmp(argv[i], "--print-notes") == 0) {
      print_notes = true;
    } else if (std::strcmp(argv[i], "--dump") == 0) {
      dump = true;
    } else if (std::strcmp(argv[i], "--scale") == 0 && i + 1 < argc) {
      scale_name = argv[++i];
    } else if (std::strcmp(argv[i], "--chords") == 0 && i + 1 < argc) {
      chords_name = argv[++i];
    } else if (std::strcmp(argv[i], "--inspect") == 0 && i + 1 < argc) {
      inspect_file = argv[++i];
    } else if (std::strcmp(argv[i], "--json") == 0) {
      json_output = true;
    } else if (std::strcmp(argv[i], "--unicode") == 0) {
      style = moira::AccidentalStyle::Unicode;
    } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      printUsage(argv[0]);
      return 0;
    } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
      std::cerr << "Error: Unknown or incomplete option: " << argv[i] << "\n";
      printUsage(argv[0]);
      return 1;
    } else if (score_file.empty()) {
      score_file = argv[i];
    } else {
      std::cerr << "Error: Only one score file can be given\n";
      return 1;
    }
  }

  if (!scale_name.empty()) return printScale(scale_name, json_output, style);
  if (!chords_name.empty()) return printChords(chords_name, style);
  if (!inspect_file.empty()) return inspectMidi(inspect_file, json_output, style);

  if (score_file.empty()) {
    printUsage(argv[0]);
    return 1;
  }

  moira::Moira moira;
  if (!moira.loadPieceFromFile(score_file)) {
    std::cerr << "Error: " << moira.error() << "\n";
    return 1;
  }

  if (dump) {
    std::cout << moira.getPieceJson(config) << "\n";
  } else {
    std::cout << "moira v" << moira::Moira::version() << "\n\n";
  }

  if (print_notes) printNotes(moira.piece(), style);

  if (!moira.render(config)) {
    printWarnings(moira.warnings());
    std::cerr << "Error: " << moira.error() << "\n";
    return 1;
  }
  printWarnings(moira.warnings());

  if (output_file.empty()) output_file = defaultOutputPath(score_file);
  if (!moira.writeMidi(output_file)) {
    std::cerr << "Error: " << moira.error() << "\n";
    return 1;
  }

  if (!dump) {
    const auto& piece = moira.piece();
    std::cout << "Wrote " << output_file << ": " << piece.voices.size() << " track(s), "
              << piece.endTick() << " ticks, " << moira.getMidi().size() << " bytes\n";
  }
  return 0;
}
