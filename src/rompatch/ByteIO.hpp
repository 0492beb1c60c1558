#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <vector>

namespace rompatch {

// Tiny binary IO helpers shared by the IPS and BPS codecs.
//
// IPS is big-endian (24-bit offsets, 16-bit lengths). BPS uses little-endian
// CRC footers and its own variable-length number encoding:
//
//   - 7 data bits per byte, least significant group first
//   - the *final* byte has the high bit set
//   - after every non-final byte the remaining value is decremented by one,
//     so each value has exactly one encoding
//
// Signed BPS numbers are stored as (abs(v) << 1) | (v < 0).

struct ByteWriter {
  std::vector<std::uint8_t> out;

  void writeBytes(const void* data, std::size_t n)
  {
    if (n == 0) return;
    const auto* p = static_cast<const std::uint8_t*>(data);
    out.insert(out.end(), p, p + n);
  }

  void writeU8(std::uint8_t v) { out.push_back(v); }

  void writeU16BE(std::uint16_t v)
  {
    const std::uint8_t b[2] = {
        static_cast<std::uint8_t>((v >> 8) & 0xFFu),
        static_cast<std::uint8_t>((v >> 0) & 0xFFu),
    };
    writeBytes(b, 2);
  }

  void writeU24BE(std::uint32_t v)
  {
    const std::uint8_t b[3] = {
        static_cast<std::uint8_t>((v >> 16) & 0xFFu),
        static_cast<std::uint8_t>((v >> 8) & 0xFFu),
        static_cast<std::uint8_t>((v >> 0) & 0xFFu),
    };
    writeBytes(b, 3);
  }

  void writeU32LE(std::uint32_t v)
  {
    const std::uint8_t b[4] = {
        static_cast<std::uint8_t>((v >> 0) & 0xFFu),
        static_cast<std::uint8_t>((v >> 8) & 0xFFu),
        static_cast<std::uint8_t>((v >> 16) & 0xFFu),
        static_cast<std::uint8_t>((v >> 24) & 0xFFu),
    };
    writeBytes(b, 4);
  }

  void writeBpsNumber(std::uint64_t v)
  {
    for (;;) {
      const std::uint8_t x = static_cast<std::uint8_t>(v & 0x7Fu);
      v >>= 7;
      if (v == 0) {
        out.push_back(static_cast<std::uint8_t>(0x80u | x));
        return;
      }
      out.push_back(x);
      --v;
    }
  }

  void writeBpsSigned(std::int64_t v)
  {
    const std::uint64_t mag = (v < 0) ? (0ull - static_cast<std::uint64_t>(v)) : static_cast<std::uint64_t>(v);
    writeBpsNumber((mag << 1) | (v < 0 ? 1u : 0u));
  }
};

struct ByteReader {
  const std::uint8_t* data = nullptr;
  std::size_t size = 0;
  std::size_t pos = 0;

  std::size_t remaining() const { return (pos < size) ? (size - pos) : 0; }

  bool readBytes(void* out, std::size_t n)
  {
    if (n == 0) return true;
    if (!out) return false;
    if (n > remaining()) return false;
    std::memcpy(out, data + pos, n);
    pos += n;
    return true;
  }

  bool skip(std::size_t n)
  {
    if (n > remaining()) return false;
    pos += n;
    return true;
  }

  bool readU8(std::uint8_t& out) { return readBytes(&out, 1); }

  bool readU16BE(std::uint16_t& out)
  {
    std::uint8_t b[2];
    if (!readBytes(b, 2)) return false;
    out = static_cast<std::uint16_t>((static_cast<std::uint16_t>(b[0]) << 8) | static_cast<std::uint16_t>(b[1]));
    return true;
  }

  bool readU24BE(std::uint32_t& out)
  {
    std::uint8_t b[3];
    if (!readBytes(b, 3)) return false;
    out = (static_cast<std::uint32_t>(b[0]) << 16) |
          (static_cast<std::uint32_t>(b[1]) << 8) |
          (static_cast<std::uint32_t>(b[2]) << 0);
    return true;
  }

  bool readU32LE(std::uint32_t& out)
  {
    std::uint8_t b[4];
    if (!readBytes(b, 4)) return false;
    out = (static_cast<std::uint32_t>(b[0]) << 0) |
          (static_cast<std::uint32_t>(b[1]) << 8) |
          (static_cast<std::uint32_t>(b[2]) << 16) |
          (static_cast<std::uint32_t>(b[3]) << 24);
    return true;
  }

  // Fails if the stream ends before a terminating byte or the value does not
  // fit in 64 bits.
  bool readBpsNumber(std::uint64_t& out)
  {
    constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
    std::uint64_t value = 0;
    std::uint64_t shift = 1;
    for (int i = 0; i < 10; ++i) {
      std::uint8_t x = 0;
      if (!readU8(x)) return false;

      const std::uint64_t group = static_cast<std::uint64_t>(x & 0x7Fu);
      if (group != 0 && shift > kMax / group) return false;
      const std::uint64_t term = group * shift;
      if (value > kMax - term) return false;
      value += term;

      if ((x & 0x80u) != 0) {
        out = value;
        return true;
      }

      if (shift > (kMax >> 7)) return false;
      shift <<= 7;
      if (value > kMax - shift) return false;
      value += shift;
    }
    return false;
  }

  bool readBpsSigned(std::int64_t& out)
  {
    std::uint64_t raw = 0;
    if (!readBpsNumber(raw)) return false;
    const std::uint64_t mag = raw >> 1;
    if (mag > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) return false;
    out = (raw & 1u) ? -static_cast<std::int64_t>(mag) : static_cast<std::int64_t>(mag);
    return true;
  }
};

} // namespace rompatch
