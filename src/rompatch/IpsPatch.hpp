#pragma once

#include "rompatch/BinaryDiff.hpp"
#include "rompatch/PatchError.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace rompatch {

// IPS ("International Patching System") patches.
//
// Layout:
//   "PATCH"
//   records:
//     u24be offset, u16be length, payload[length]
//     u24be offset, u16be 0, u16be count, u8 value      (RLE)
//   "EOF"
//   optional u24be truncation size
//
// Offsets are limited to 24 bits. The offset 0x454F46 spells "EOF" and can
// never start a record.

inline constexpr std::uint32_t kIpsMaxOffset = 0xFFFFFFu;
inline constexpr std::uint32_t kIpsEofOffset = 0x454F46u;
inline constexpr std::uint32_t kIpsMaxRecordLength = 0xFFFFu;

struct IpsRecord {
  std::uint32_t offset = 0;

  bool rle = false;
  std::uint16_t rleLength = 0; // rle only
  std::uint8_t rleValue = 0;   // rle only

  std::vector<std::uint8_t> bytes; // literal only

  std::uint32_t length() const { return rle ? rleLength : static_cast<std::uint32_t>(bytes.size()); }
};

struct IpsPatch {
  std::vector<IpsRecord> records;

  bool hasTruncation = false;
  std::uint32_t truncateSize = 0;
};

struct IpsEncodeOptions {
  // Changed runs shorter than this are stored as literal bytes. An RLE record
  // costs 8 bytes on the wire.
  std::uint64_t minRleLength = 4;
};

struct IpsApplyOptions {
  bool honorTruncation = true;
};

// Build a patch from edit operations covering `target`.
//
// Only bytes that differ from `source` (or lie past its end) are emitted. Run
// operations become RLE records, everything else becomes literal records of at
// most 0xFFFF bytes. Fails with CapacityExceeded when a record would start
// beyond 0xFFFFFF or a truncation size does not fit 24 bits.
bool EncodeIpsPatch(const std::vector<std::uint8_t>& source, const std::vector<std::uint8_t>& target,
                    const std::vector<EditOperation>& ops, const IpsEncodeOptions& opt, IpsPatch& outPatch,
                    PatchError& outError);

bool SerializeIpsPatch(const IpsPatch& patch, std::vector<std::uint8_t>& outBytes, PatchError& outError);

bool DeserializeIpsPatch(IpsPatch& outPatch, const std::uint8_t* data, std::size_t size, PatchError& outError);

// Zero-copy view of one record while scanning a patch buffer.
struct IpsRecordView {
  std::uint32_t offset = 0;
  std::uint32_t length = 0;
  bool rle = false;
  std::uint8_t rleValue = 0;
  const std::uint8_t* payload = nullptr; // literal only, `length` bytes
};

struct IpsTrailer {
  bool hasTruncation = false;
  std::uint32_t truncateSize = 0;
};

// Walk the records of a serialized patch without copying payloads.
// DeserializeIpsPatch() and the inspector are both built on this.
bool ScanIpsPatch(const std::uint8_t* data, std::size_t size,
                  const std::function<void(const IpsRecordView&)>& onRecord, IpsTrailer& outTrailer,
                  PatchError& outError);

// Apply records in order to a copy of `source`. The buffer grows (zero filled)
// when a record writes past its end. With honorTruncation the result is cut to
// the patch's truncation size.
bool ApplyIpsPatch(const std::vector<std::uint8_t>& source, const IpsPatch& patch, const IpsApplyOptions& opt,
                   std::vector<std::uint8_t>& outTarget, PatchError& outError);

} // namespace rompatch
