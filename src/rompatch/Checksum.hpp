#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace rompatch {

// CRC32 used by both patch formats and by the CLI summaries.
//
//   - IEEE 802.3 polynomial, reflected (0xEDB88320)
//   - init = 0xFFFFFFFF, finalize by XOR with 0xFFFFFFFF
//
// This is the same CRC as zlib's crc32(), so values printed by rompatch can be
// compared with other patching tools and ROM databases.

// Incremental CRC32 update.
//
// Typical usage:
//   std::uint32_t crc = 0xFFFFFFFFu;
//   crc = Crc32Update(crc, data, size);
//   ...
//   crc ^= 0xFFFFFFFFu;
std::uint32_t Crc32Update(std::uint32_t crc, const std::uint8_t* data, std::size_t size);

// Convenience: compute a finalized CRC32 for a single buffer.
inline std::uint32_t Crc32(const std::uint8_t* data, std::size_t size)
{
  std::uint32_t crc = 0xFFFFFFFFu;
  crc = Crc32Update(crc, data, size);
  return crc ^ 0xFFFFFFFFu;
}

inline std::uint32_t Crc32(const std::vector<std::uint8_t>& bytes)
{
  return Crc32(bytes.data(), bytes.size());
}

} // namespace rompatch
