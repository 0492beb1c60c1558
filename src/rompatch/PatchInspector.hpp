#pragma once

#include "rompatch/PatchApplier.hpp"
#include "rompatch/PatchError.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace rompatch {

// Header/record level view of a patch file. Built without reconstructing the
// target and without keeping a reference to the patch buffer.

struct PatchRecordSummary {
  std::uint64_t offset = 0;
  std::uint64_t length = 0;
  bool rle = false;
  std::uint8_t rleValue = 0;
};

struct PatchInfo {
  PatchFormat format = PatchFormat::Unknown;
  std::uint64_t patchSize = 0;

  // Total bytes produced by all records/actions.
  std::uint64_t bytesWritten = 0;

  // --- IPS ---
  std::uint64_t recordCount = 0;
  std::uint64_t literalRecords = 0;
  std::uint64_t rleRecords = 0;

  // One past the highest offset any record writes.
  std::uint64_t writeEnd = 0;

  bool hasTruncation = false;
  std::uint64_t truncateSize = 0;

  // First records in patch order (see InspectPatch's maxRecordSummaries).
  std::vector<PatchRecordSummary> records;

  // --- BPS ---
  std::uint64_t sourceSize = 0;
  std::uint64_t targetSize = 0;
  std::uint32_t sourceCrc32 = 0;
  std::uint32_t targetCrc32 = 0;
  std::uint32_t patchCrc32 = 0;
  std::uint32_t computedPatchCrc32 = 0;
  bool patchCrcValid = false;

  std::uint64_t metadataSize = 0;
  std::string metadataPreview; // printable ASCII, truncated

  // Indexed by BpsAction.
  std::uint64_t actionCount[4] = {0, 0, 0, 0};
  std::uint64_t actionBytes[4] = {0, 0, 0, 0};

  std::uint64_t totalActions() const { return actionCount[0] + actionCount[1] + actionCount[2] + actionCount[3]; }
};

// Parse headers, footers and records. A BPS patch CRC mismatch is reported via
// PatchInfo::patchCrcValid, structural problems fail with FormatError.
bool InspectPatch(const std::uint8_t* data, std::size_t size, PatchInfo& outInfo, PatchError& outError,
                  std::size_t maxRecordSummaries = 64);

inline bool InspectPatch(const std::vector<std::uint8_t>& bytes, PatchInfo& outInfo, PatchError& outError,
                         std::size_t maxRecordSummaries = 64)
{
  return InspectPatch(bytes.data(), bytes.size(), outInfo, outError, maxRecordSummaries);
}

// Human readable report. At most maxRecords IPS records are listed.
std::string FormatPatchInfo(const PatchInfo& info, std::size_t maxRecords = 20);

bool WritePatchInfoJson(std::ostream& os, const PatchInfo& info, std::string& outError);

} // namespace rompatch
