/**
 * @file scale.cpp
 * @brief Implementation of scale creation, degree spelling and scale names.
 */

#include "core/scale.h"

#include <cmath>
#include <cstdlib>
#include <sstream>

#ifndef SCALE_DEBUG_LOG
#define SCALE_DEBUG_LOG 0
#endif

#if SCALE_DEBUG_LOG
#include <iostream>
#endif

namespace moira {

namespace {

struct ScaleTypeDef {
  ScaleType type;
  const char* suffix;
  const char* name;
  std::vector<int8_t> offsets;
};

const std::vector<ScaleTypeDef>& scaleTypeDefs() {
  static const std::vector<ScaleTypeDef> kDefs = {
      {ScaleType::Major, "maj", "Major", {0, 2, 4, 5, 7, 9, 11}},
      {ScaleType::NaturalMinor, "min", "Natural minor", {0, 2, 3, 5, 7, 8, 10}},
      {ScaleType::HarmonicMinor, "harm", "Harmonic minor", {0, 2, 3, 5, 7, 8, 11}},
      {ScaleType::MelodicMinor, "mel", "Melodic minor", {0, 2, 3, 5, 7, 9, 11}},
      {ScaleType::Dorian, "dorian", "Dorian", {0, 2, 3, 5, 7, 9, 10}},
      {ScaleType::Phrygian, "phrygian", "Phrygian", {0, 1, 3, 5, 7, 8, 10}},
      {ScaleType::Lydian, "lydian", "Lydian", {0, 2, 4, 6, 7, 9, 11}},
      {ScaleType::Mixolydian, "mixolydian", "Mixolydian", {0, 2, 4, 5, 7, 9, 10}},
      {ScaleType::Locrian, "locrian", "Locrian", {0, 1, 3, 5, 6, 8, 10}},
      {ScaleType::MajorPentatonic, "pent", "Major pentatonic", {0, 2, 4, 7, 9}},
      {ScaleType::MinorPentatonic, "minpent", "Minor pentatonic", {0, 3, 5, 7, 10}},
  };
  return kDefs;
}

// Long-form aliases accepted by parseScaleName() in addition to the suffixes.
struct ScaleAlias {
  const char* alias;
  ScaleType type;
};

constexpr ScaleAlias kAliases[] = {
    {"major", ScaleType::Major},
    {"minor", ScaleType::NaturalMinor},
};

int floorDiv(int a, int b) {
  int q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
  return q;
}

int floorMod(int a, int b) { return ((a % b) + b) % b; }

std::string offsetsToString(const std::vector<int8_t>& offsets) {
  std::ostringstream oss;
  oss << "{";
  for (size_t i = 0; i < offsets.size(); ++i) {
    if (i > 0) oss << ",";
    oss << static_cast<int>(offsets[i]);
  }
  oss << "}";
  return oss.str();
}

// Parses "{0,2,4}" into offsets. Range and ordering are checked by Scale::create().
bool parseOffsetList(const std::string& text, std::vector<int8_t>& offsets) {
  if (text.size() < 2 || text.front() != '{' || text.back() != '}') return false;

  std::string body = text.substr(1, text.size() - 2);
  std::istringstream iss(body);
  std::string item;
  while (std::getline(iss, item, ',')) {
    if (item.empty()) return false;
    char* end = nullptr;
    long value = std::strtol(item.c_str(), &end, 10);
    if (*end != '\0' || value < -128 || value > 127) return false;
    offsets.push_back(static_cast<int8_t>(value));
  }
  return true;
}

}  // namespace

std::vector<int8_t> scaleTypeOffsets(ScaleType type) {
  for (const auto& def : scaleTypeDefs()) {
    if (def.type == type) return def.offsets;
  }
  return {};
}

const char* scaleTypeSuffix(ScaleType type) {
  for (const auto& def : scaleTypeDefs()) {
    if (def.type == type) return def.suffix;
  }
  return "";
}

const char* scaleTypeName(ScaleType type) {
  for (const auto& def : scaleTypeDefs()) {
    if (def.type == type) return def.name;
  }
  return "Custom";
}

Scale::Scale() : offsets_(scaleTypeOffsets(ScaleType::Major)), type_(ScaleType::Major) {
  spellDegrees();
}

ScaleResult Scale::create(const NamedKey& tonic, const std::vector<int8_t>& offsets) {
  ScaleResult result;
  if (offsets.empty()) {
    result.error = "A scale needs at least one offset!";
    return result;
  }

  int previous = -1;
  for (int8_t offset : offsets) {
    if (offset < 0 || offset > 11) {
      result.error = "All offsets must be between 0 and 11!";
      return result;
    }
    if (offset <= previous) {
      result.error = "Offsets must be in strictly increasing order!";
      return result;
    }
    previous = offset;
  }

  Scale scale;
  scale.tonic_ = tonic;
  scale.offsets_ = offsets;
  scale.type_ = ScaleType::Custom;
  for (const auto& def : scaleTypeDefs()) {
    if (def.offsets == offsets) {
      scale.type_ = def.type;
      break;
    }
  }
  scale.spellDegrees();
  result.scale = std::move(scale);
  return result;
}

Scale Scale::fromType(const NamedKey& tonic, ScaleType type) {
  Scale scale;
  scale.tonic_ = tonic;
  scale.offsets_ = scaleTypeOffsets(type);
  scale.type_ = type;
  scale.spellDegrees();
  return scale;
}

void Scale::spellDegrees() {
  degrees_.clear();
  warnings_.clear();

  auto letters = lettersFrom(tonic_.letter);
  size_t next_letter = 0;
  PitchClass tonic_pc = tonic_.pitchClass();

  for (size_t i = 0; i < offsets_.size(); ++i) {
    PitchClass pc = tonic_pc + offsets_[i];

    // Scales with fewer than seven degrees have spare letters and may skip
    // one (C minor pentatonic is C Eb F G Bb, not C D# F G A#).
    int remaining_degrees = static_cast<int>(offsets_.size() - i);
    int spare_letters = static_cast<int>(letters.size() - next_letter) - remaining_degrees;
    if (spare_letters < 0) spare_letters = 0;

    std::optional<NamedKey> best;
    size_t best_letter = 0;
    double best_score = 0.0;
    for (int skip = 0; skip <= spare_letters; ++skip) {
      size_t letter_idx = next_letter + static_cast<size_t>(skip);
      if (letter_idx >= letters.size()) break;
      auto spelled = pc.spellWithLetter(letters[letter_idx]);
      if (!spelled) continue;

      // Fewest accidentals first, then the letter closest to the interval size.
      double ideal_step = offsets_[i] * 7.0 / 12.0;
      double score = std::abs(accidentalValue(spelled->accidental)) +
                     0.5 * std::fabs(static_cast<double>(letter_idx) - ideal_step);
      if (!best || score < best_score) {
        best = spelled;
        best_letter = letter_idx;
        best_score = score;
      }
    }

    if (best) {
      degrees_.push_back(*best);
      next_letter = best_letter + 1;
      continue;
    }

    NamedKey fallback = pc.defaultSpelling();
    warnings_.push_back("Could not spell degree " + std::to_string(i) + " of " + name() +
                        " consecutively, using " + fallback.toString());
#if SCALE_DEBUG_LOG
    std::cerr << "  [scale] " << name() << " degree " << i << " offset "
              << static_cast<int>(offsets_[i]) << " -> default " << fallback << "\n";
#endif
    degrees_.push_back(fallback);
  }
}

std::string Scale::name() const {
  if (type_ == ScaleType::Custom) return tonic_.toString() + offsetsToString(offsets_);
  return tonic_.toString() + scaleTypeSuffix(type_);
}

NamedKey Scale::degreeKey(int position) const {
  int len = static_cast<int>(degrees_.size());
  return degrees_[floorMod(position, len)];
}

std::optional<NamedNote> Scale::degreeNote(int position, int octave) const {
  int len = static_cast<int>(offsets_.size());
  int index = floorMod(position, len);
  int extra_octaves = floorDiv(position, len);

  // Octave numbering follows the tonic's spelling: Cb4 is B3, B#4 is C5.
  int midi = (octave + extra_octaves + 1) * 12 + letterPitchClass(tonic_.letter) +
             accidentalValue(tonic_.accidental) + offsets_[index];
  auto note = Note::fromInt(midi);
  if (!note) return std::nullopt;
  return note->spellWithLetter(degrees_[index].letter);
}

std::optional<Note> Scale::degreeMidiNote(int position, int octave) const {
  auto named = degreeNote(position, octave);
  if (!named) return std::nullopt;
  return named->toNote();
}

std::optional<int> Scale::findDegree(PitchClass pc) const {
  PitchClass tonic_pc = tonic_.pitchClass();
  for (size_t i = 0; i < offsets_.size(); ++i) {
    if (tonic_pc + offsets_[i] == pc) return static_cast<int>(i);
  }
  return std::nullopt;
}

ScaleResult parseScaleName(const std::string& text) {
  ScaleResult invalid;
  invalid.error = "Invalid scale: " + text;

  if (text.empty()) return invalid;
  auto key = parseNamedKey(text.substr(0, 1));
  if (!key) return invalid;

  size_t pos = 1;
  key->accidental = readAccidental(text, pos);
  std::string suffix = text.substr(pos);

  if (!suffix.empty() && suffix.front() == '{') {
    std::vector<int8_t> offsets;
    if (!parseOffsetList(suffix, offsets)) return invalid;
    ScaleResult result = Scale::create(*key, offsets);
    if (!result.ok()) result.error = "Invalid scale: " + text + " (" + result.error + ")";
    return result;
  }

  for (const auto& def : scaleTypeDefs()) {
    if (suffix == def.suffix) {
      ScaleResult result;
      result.scale = Scale::fromType(*key, def.type);
      return result;
    }
  }
  for (const auto& alias : kAliases) {
    if (suffix == alias.alias) {
      ScaleResult result;
      result.scale = Scale::fromType(*key, alias.type);
      return result;
    }
  }
  return invalid;
}

}  // namespace moira
