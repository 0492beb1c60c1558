#pragma once

#include "rompatch/BinaryDiff.hpp"
#include "rompatch/PatchError.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace rompatch {

// BPS ("beat patch system") delta patches.
//
// Layout:
//   "BPS1"
//   number sourceSize
//   number targetSize
//   number metadataSize, metadata[metadataSize]
//   actions until the footer:
//     number ((length - 1) << 2) | action
//     TargetRead:             length literal bytes
//     SourceCopy/TargetCopy:  signed number, relative to that buffer's cursor
//   u32le sourceCrc32, u32le targetCrc32, u32le patchCrc32
//
// The patch CRC covers every byte before it. See ByteIO.hpp for the number
// encoding.

enum class BpsAction : std::uint8_t {
  SourceRead = 0, // source[outPos ..]
  TargetRead = 1, // literal bytes stored in the patch
  SourceCopy = 2, // source[sourceCursor + delta ..]
  TargetCopy = 3, // output[targetCursor + delta ..], may overlap the write position
};

const char* BpsActionName(BpsAction a);

struct BpsCommand {
  BpsAction action = BpsAction::SourceRead;
  std::uint64_t length = 0;

  // SourceCopy / TargetCopy only.
  std::int64_t relativeOffset = 0;

  // TargetRead only: offset of the literal bytes in BpsPatch::targetData.
  std::uint64_t dataOffset = 0;
};

struct BpsPatch {
  std::uint64_t sourceSize = 0;
  std::uint64_t targetSize = 0;
  std::vector<std::uint8_t> metadata;

  std::vector<BpsCommand> commands;
  std::vector<std::uint8_t> targetData; // concatenated TargetRead payloads

  std::uint32_t sourceCrc32 = 0;
  std::uint32_t targetCrc32 = 0;

  // Set by DeserializeBpsPatch(). SerializeBpsPatch() always computes it.
  std::uint32_t patchCrc32 = 0;
};

// Smallest possible patch: magic, three one-byte numbers, footer.
inline constexpr std::size_t kBpsMinPatchSize = 4 + 3 + 12;

// Translate edit operations into BPS actions. Adjacent SourceRead and adjacent
// TargetRead actions are merged.
bool EncodeBpsPatch(const std::vector<std::uint8_t>& source, const std::vector<std::uint8_t>& target,
                    const std::vector<EditOperation>& ops, const std::vector<std::uint8_t>& metadata,
                    BpsPatch& outPatch, PatchError& outError);

bool SerializeBpsPatch(const BpsPatch& patch, std::vector<std::uint8_t>& outBytes, PatchError& outError);

// Checks the magic (FormatError), then the patch CRC (CorruptPatch), then
// parses the header and action stream (FormatError).
bool DeserializeBpsPatch(BpsPatch& outPatch, const std::uint8_t* data, std::size_t size, PatchError& outError);

// Parsed header/footer of a serialized patch.
struct BpsHeader {
  std::uint64_t sourceSize = 0;
  std::uint64_t targetSize = 0;

  std::size_t metadataOffset = 0; // into the scanned buffer
  std::uint64_t metadataSize = 0;

  std::uint32_t sourceCrc32 = 0;
  std::uint32_t targetCrc32 = 0;
  std::uint32_t patchCrc32 = 0;         // stored in the footer
  std::uint32_t computedPatchCrc32 = 0; // over the bytes before it

  bool patchCrcValid() const { return patchCrc32 == computedPatchCrc32; }
};

struct BpsCommandView {
  BpsAction action = BpsAction::SourceRead;
  std::uint64_t length = 0;
  std::int64_t relativeOffset = 0;
  const std::uint8_t* data = nullptr; // TargetRead only
};

// Structural walk of a serialized patch. Does not fail on a patch CRC mismatch;
// callers decide via BpsHeader::patchCrcValid().
bool ScanBpsPatch(const std::uint8_t* data, std::size_t size,
                  const std::function<void(const BpsCommandView&)>& onCommand, BpsHeader& outHeader,
                  PatchError& outError);

// Verifies source size and CRC (SourceMismatch) before replaying. Replay
// errors and a target CRC mismatch are CorruptPatch; outTarget stays empty.
bool ApplyBpsPatch(const std::vector<std::uint8_t>& source, const BpsPatch& patch,
                   std::vector<std::uint8_t>& outTarget, PatchError& outError);

} // namespace rompatch
