#include "rompatch/PatchInspector.hpp"

#include "rompatch/BpsPatch.hpp"
#include "rompatch/IpsPatch.hpp"
#include "rompatch/Json.hpp"

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <utility>

namespace rompatch {

namespace {

constexpr std::size_t kMetadataPreviewChars = 64;

std::string HexU32(std::uint32_t v)
{
  std::ostringstream oss;
  oss << "0x" << std::hex << std::uppercase << std::setw(8) << std::setfill('0') << v;
  return oss.str();
}

std::string HexOffset(std::uint64_t v)
{
  std::ostringstream oss;
  oss << "0x" << std::hex << std::uppercase << std::setw(6) << std::setfill('0') << v;
  return oss.str();
}

std::string PreviewText(const std::uint8_t* data, std::size_t size)
{
  std::string s;
  const std::size_t n = std::min(size, kMetadataPreviewChars);
  s.reserve(n + 3);
  for (std::size_t i = 0; i < n; ++i) {
    const std::uint8_t c = data[i];
    s.push_back((c >= 0x20 && c < 0x7F) ? static_cast<char>(c) : '.');
  }
  if (size > n) s += "...";
  return s;
}

bool InspectIps(const std::uint8_t* data, std::size_t size, PatchInfo& info, PatchError& outError,
                std::size_t maxRecordSummaries)
{
  IpsTrailer trailer;
  const bool ok = ScanIpsPatch(
      data, size,
      [&](const IpsRecordView& v) {
        ++info.recordCount;
        if (v.rle) {
          ++info.rleRecords;
        } else {
          ++info.literalRecords;
        }
        info.bytesWritten += v.length;
        info.writeEnd = std::max<std::uint64_t>(info.writeEnd, std::uint64_t{v.offset} + v.length);

        if (info.records.size() < maxRecordSummaries) {
          PatchRecordSummary r;
          r.offset = v.offset;
          r.length = v.length;
          r.rle = v.rle;
          r.rleValue = v.rleValue;
          info.records.push_back(r);
        }
      },
      trailer, outError);
  if (!ok) return false;

  info.hasTruncation = trailer.hasTruncation;
  info.truncateSize = trailer.truncateSize;
  return true;
}

bool InspectBps(const std::uint8_t* data, std::size_t size, PatchInfo& info, PatchError& outError)
{
  BpsHeader h;
  const bool ok = ScanBpsPatch(
      data, size,
      [&](const BpsCommandView& v) {
        const std::size_t k = static_cast<std::size_t>(v.action);
        ++info.actionCount[k];
        info.actionBytes[k] += v.length;
        info.bytesWritten += v.length;
      },
      h, outError);
  if (!ok) return false;

  info.sourceSize = h.sourceSize;
  info.targetSize = h.targetSize;
  info.sourceCrc32 = h.sourceCrc32;
  info.targetCrc32 = h.targetCrc32;
  info.patchCrc32 = h.patchCrc32;
  info.computedPatchCrc32 = h.computedPatchCrc32;
  info.patchCrcValid = h.patchCrcValid();
  info.metadataSize = h.metadataSize;
  info.metadataPreview = PreviewText(data + h.metadataOffset, static_cast<std::size_t>(h.metadataSize));
  return true;
}

} // namespace

bool InspectPatch(const std::uint8_t* data, std::size_t size, PatchInfo& outInfo, PatchError& outError,
                  std::size_t maxRecordSummaries)
{
  outError.clear();
  outInfo = PatchInfo{};

  PatchInfo info;
  info.format = DetectPatchFormat(data, size);
  info.patchSize = size;

  bool ok = false;
  switch (info.format) {
  case PatchFormat::Ips: ok = InspectIps(data, size, info, outError, maxRecordSummaries); break;
  case PatchFormat::Bps: ok = InspectBps(data, size, info, outError); break;
  case PatchFormat::Unknown:
    return Fail(outError, PatchErrorKind::FormatError, "unrecognized patch format (expected IPS or BPS magic)");
  }
  if (!ok) return false;

  outInfo = std::move(info);
  return true;
}

std::string FormatPatchInfo(const PatchInfo& info, std::size_t maxRecords)
{
  std::ostringstream oss;
  oss << "Patch format: " << PatchFormatName(info.format) << "\n";
  oss << "  patch size:     " << info.patchSize << " bytes\n";

  if (info.format == PatchFormat::Ips) {
    oss << "  records:        " << info.recordCount << " (" << info.literalRecords << " literal, " << info.rleRecords
        << " rle)\n";
    oss << "  bytes written:  " << info.bytesWritten << "\n";
    oss << "  write end:      " << HexOffset(info.writeEnd) << "\n";
    if (info.hasTruncation) {
      oss << "  truncate to:    " << info.truncateSize << " bytes\n";
    }

    const std::size_t shown = std::min(maxRecords, info.records.size());
    if (shown > 0) oss << "Records:\n";
    for (std::size_t i = 0; i < shown; ++i) {
      const PatchRecordSummary& r = info.records[i];
      oss << "  " << std::setw(4) << i << ". " << HexOffset(r.offset) << "  ";
      if (r.rle) {
        oss << "rle     " << r.length << " x 0x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
            << static_cast<unsigned>(r.rleValue) << std::dec << std::setfill(' ') << "\n";
      } else {
        oss << "literal " << r.length << " bytes\n";
      }
    }
    if (info.recordCount > shown) {
      oss << "  ... and " << (info.recordCount - shown) << " more records\n";
    }
    return oss.str();
  }

  if (info.format == PatchFormat::Bps) {
    oss << "  source size:    " << info.sourceSize << " bytes (crc32 " << HexU32(info.sourceCrc32) << ")\n";
    oss << "  target size:    " << info.targetSize << " bytes (crc32 " << HexU32(info.targetCrc32) << ")\n";
    oss << "  patch crc32:    " << HexU32(info.patchCrc32);
    if (info.patchCrcValid) {
      oss << " (ok)\n";
    } else {
      oss << " (MISMATCH, computed " << HexU32(info.computedPatchCrc32) << ")\n";
    }
    oss << "  metadata:       " << info.metadataSize << " bytes";
    if (!info.metadataPreview.empty()) oss << " \"" << info.metadataPreview << "\"";
    oss << "\n";
    oss << "  actions:        " << info.totalActions() << "\n";
    for (std::size_t k = 0; k < 4; ++k) {
      oss << "    " << std::left << std::setw(12) << BpsActionName(static_cast<BpsAction>(k)) << std::right
          << info.actionCount[k] << " (" << info.actionBytes[k] << " bytes)\n";
    }
    oss << "  bytes written:  " << info.bytesWritten << "\n";
  }

  return oss.str();
}

bool WritePatchInfoJson(std::ostream& os, const PatchInfo& info, std::string& outError)
{
  JsonWriter w(os);

  const auto fail = [&]() {
    outError = w.error();
    return false;
  };

  if (!w.beginObject()) return fail();
  if (!w.key("format") || !w.stringValue(PatchFormatName(info.format))) return fail();
  if (!w.key("patch_size") || !w.uintValue(info.patchSize)) return fail();
  if (!w.key("bytes_written") || !w.uintValue(info.bytesWritten)) return fail();

  if (info.format == PatchFormat::Ips) {
    if (!w.key("record_count") || !w.uintValue(info.recordCount)) return fail();
    if (!w.key("literal_records") || !w.uintValue(info.literalRecords)) return fail();
    if (!w.key("rle_records") || !w.uintValue(info.rleRecords)) return fail();
    if (!w.key("write_end") || !w.uintValue(info.writeEnd)) return fail();
    if (!w.key("truncate_size")) return fail();
    if (info.hasTruncation) {
      if (!w.uintValue(info.truncateSize)) return fail();
    } else {
      if (!w.nullValue()) return fail();
    }

    if (!w.key("records") || !w.beginArray()) return fail();
    for (const PatchRecordSummary& r : info.records) {
      if (!w.beginObject()) return fail();
      if (!w.key("offset") || !w.uintValue(r.offset)) return fail();
      if (!w.key("length") || !w.uintValue(r.length)) return fail();
      if (!w.key("rle") || !w.boolValue(r.rle)) return fail();
      if (r.rle && (!w.key("value") || !w.uintValue(r.rleValue))) return fail();
      if (!w.endObject()) return fail();
    }
    if (!w.endArray()) return fail();
  } else if (info.format == PatchFormat::Bps) {
    if (!w.key("source_size") || !w.uintValue(info.sourceSize)) return fail();
    if (!w.key("target_size") || !w.uintValue(info.targetSize)) return fail();
    if (!w.key("source_crc32") || !w.stringValue(HexU32(info.sourceCrc32))) return fail();
    if (!w.key("target_crc32") || !w.stringValue(HexU32(info.targetCrc32))) return fail();
    if (!w.key("patch_crc32") || !w.stringValue(HexU32(info.patchCrc32))) return fail();
    if (!w.key("patch_crc_valid") || !w.boolValue(info.patchCrcValid)) return fail();
    if (!w.key("metadata_size") || !w.uintValue(info.metadataSize)) return fail();
    if (!w.key("metadata_preview") || !w.stringValue(info.metadataPreview)) return fail();

    if (!w.key("actions") || !w.beginObject()) return fail();
    for (std::size_t k = 0; k < 4; ++k) {
      if (!w.key(BpsActionName(static_cast<BpsAction>(k))) || !w.beginObject()) return fail();
      if (!w.key("count") || !w.uintValue(info.actionCount[k])) return fail();
      if (!w.key("bytes") || !w.uintValue(info.actionBytes[k])) return fail();
      if (!w.endObject()) return fail();
    }
    if (!w.endObject()) return fail();
  }

  if (!w.endObject() || !w.finish()) return fail();
  outError.clear();
  return true;
}

} // namespace rompatch
