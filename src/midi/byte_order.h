/**
 * @file byte_order.h
 * @brief Big-endian integers and variable-length quantities for SMF data.
 */

#ifndef MOIRA_MIDI_BYTE_ORDER_H
#define MOIRA_MIDI_BYTE_ORDER_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace moira {

/// @brief Read a big-endian uint16 from at least 2 bytes.
inline uint16_t readUint16BE(const uint8_t* data) {
  return static_cast<uint16_t>((static_cast<uint16_t>(data[0]) << 8) | data[1]);
}

/// @brief Read a big-endian uint32 from at least 4 bytes.
inline uint32_t readUint32BE(const uint8_t* data) {
  return (static_cast<uint32_t>(data[0]) << 24) | (static_cast<uint32_t>(data[1]) << 16) |
         (static_cast<uint32_t>(data[2]) << 8) | data[3];
}

inline void writeUint16BE(std::vector<uint8_t>& buf, uint16_t value) {
  buf.push_back((value >> 8) & 0xFF);
  buf.push_back(value & 0xFF);
}

inline void writeUint32BE(std::vector<uint8_t>& buf, uint32_t value) {
  buf.push_back((value >> 24) & 0xFF);
  buf.push_back((value >> 16) & 0xFF);
  buf.push_back((value >> 8) & 0xFF);
  buf.push_back(value & 0xFF);
}

/// @brief Largest value a four-byte variable-length quantity can hold.
constexpr uint32_t kMaxVariableLength = 0x0FFFFFFF;

/**
 * @brief Append a MIDI variable-length quantity (VLQ).
 *
 * Seven data bits per byte, most significant group first, high bit set on
 * every byte but the last. Values above kMaxVariableLength are clamped.
 */
inline void writeVariableLength(std::vector<uint8_t>& buf, uint32_t value) {
  if (value > kMaxVariableLength) value = kMaxVariableLength;

  uint8_t groups[4];
  size_t count = 0;
  do {
    groups[count++] = value & 0x7F;
    value >>= 7;
  } while (value > 0);

  for (size_t i = count; i > 0; --i) {
    uint8_t b = groups[i - 1];
    if (i > 1) b |= 0x80;
    buf.push_back(b);
  }
}

/**
 * @brief Read a MIDI variable-length quantity.
 *
 * @param data Byte buffer to read from
 * @param offset Current read position (updated on return)
 * @param max_size Buffer size
 * @param value Output: decoded value
 * @return false if the data is truncated or longer than 4 bytes
 */
inline bool readVariableLength(const uint8_t* data, size_t& offset, size_t max_size,
                               uint32_t& value) {
  value = 0;
  size_t count = 0;

  do {
    if (offset >= max_size || count >= 4) {
      return false;
    }
    uint8_t byte = data[offset++];
    value = (value << 7) | (byte & 0x7F);
    if (!(byte & 0x80)) break;
    count++;
  } while (true);

  return true;
}

}  // namespace moira

#endif  // MOIRA_MIDI_BYTE_ORDER_H
