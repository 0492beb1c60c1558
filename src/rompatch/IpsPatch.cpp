#include "rompatch/IpsPatch.hpp"

#include "rompatch/ByteIO.hpp"

#include <algorithm>
#include <cstring>
#include <sstream>
#include <string>
#include <utility>

namespace rompatch {

namespace {

constexpr std::uint8_t kIpsMagic[5] = {'P', 'A', 'T', 'C', 'H'};
constexpr std::uint8_t kIpsEof[3] = {'E', 'O', 'F'};

// offset (3) + length (2). Unchanged gaps shorter than this are carried inside
// the current literal record instead of opening a new one.
constexpr std::size_t kIpsRecordHeaderBytes = 5;

std::string HexOffset(std::uint64_t v)
{
  std::ostringstream oss;
  oss << "0x" << std::hex << std::uppercase << v;
  return oss.str();
}

// A maximal run of changed target bytes inside one edit operation.
struct ChangedSpan {
  std::size_t begin = 0;
  std::size_t end = 0;
  bool rle = false;
};

// Accumulates literal records, splitting at 0xFFFF bytes and moving records
// off the EOF marker offset.
struct LiteralBuilder {
  const std::vector<std::uint8_t>& target;
  IpsPatch& patch;

  bool open = false;
  IpsRecord cur;

  LiteralBuilder(const std::vector<std::uint8_t>& t, IpsPatch& p) : target(t), patch(p) {}

  std::size_t end() const { return static_cast<std::size_t>(cur.offset) + cur.bytes.size(); }

  void flush()
  {
    if (!open) return;
    if (!cur.bytes.empty()) patch.records.push_back(std::move(cur));
    cur = IpsRecord{};
    open = false;
  }

  bool start(std::size_t pos, PatchError& outError)
  {
    std::size_t at = pos;
    // A record starting at 0x454F46 would read as the terminator. Start one
    // byte earlier and repeat the target byte there.
    if (at == kIpsEofOffset) --at;
    if (at > kIpsMaxOffset) {
      return Fail(outError, PatchErrorKind::CapacityExceeded,
                  "IPS record offset " + HexOffset(at) + " exceeds 24-bit limit");
    }
    cur = IpsRecord{};
    cur.offset = static_cast<std::uint32_t>(at);
    for (std::size_t i = at; i < pos; ++i) cur.bytes.push_back(target[i]);
    open = true;
    return true;
  }

  bool append(std::size_t begin, std::size_t endPos, PatchError& outError)
  {
    for (std::size_t i = begin; i < endPos; ++i) {
      if (!open && !start(i, outError)) return false;
      cur.bytes.push_back(target[i]);
      if (cur.bytes.size() >= kIpsMaxRecordLength) flush();
    }
    return true;
  }
};

} // namespace

bool EncodeIpsPatch(const std::vector<std::uint8_t>& source, const std::vector<std::uint8_t>& target,
                    const std::vector<EditOperation>& ops, const IpsEncodeOptions& opt, IpsPatch& outPatch,
                    PatchError& outError)
{
  outError.clear();
  outPatch = IpsPatch{};

  if (opt.minRleLength < 1) {
    return Fail(outError, PatchErrorKind::InvalidArgument, "min RLE length must be >= 1");
  }
  if (!ValidateEditOperations(ops, target.size(), outError)) return false;

  if (target.size() < source.size() && target.size() > kIpsMaxOffset) {
    return Fail(outError, PatchErrorKind::CapacityExceeded,
                "IPS truncation size " + HexOffset(target.size()) + " exceeds 24-bit limit");
  }

  const auto changed = [&](std::size_t i) { return i >= source.size() || source[i] != target[i]; };

  // Intersect every operation with the changed-byte mask.
  std::vector<ChangedSpan> spans;
  for (const EditOperation& op : ops) {
    const std::size_t a = static_cast<std::size_t>(op.targetOffset);
    const std::size_t e = a + static_cast<std::size_t>(op.length);
    std::size_t i = a;
    while (i < e) {
      while (i < e && !changed(i)) ++i;
      std::size_t j = i;
      while (j < e && changed(j)) ++j;
      if (j > i) {
        ChangedSpan s;
        s.begin = i;
        s.end = j;
        s.rle = (op.kind == EditKind::Run) && (j - i) >= opt.minRleLength;
        spans.push_back(s);
      }
      i = j;
    }
  }

  IpsPatch patch;
  LiteralBuilder lit(target, patch);

  for (const ChangedSpan& s : spans) {
    if (!s.rle) {
      if (lit.open && s.begin - lit.end() < kIpsRecordHeaderBytes) {
        if (!lit.append(lit.end(), s.end, outError)) return false;
      } else {
        lit.flush();
        if (!lit.append(s.begin, s.end, outError)) return false;
      }
      continue;
    }

    lit.flush();
    std::size_t off = s.begin;
    while (off < s.end) {
      const std::size_t chunk = std::min<std::size_t>(s.end - off, kIpsMaxRecordLength);
      if (chunk < opt.minRleLength || off == kIpsEofOffset) {
        if (!lit.append(off, off + chunk, outError)) return false;
      } else {
        lit.flush();
        if (off > kIpsMaxOffset) {
          return Fail(outError, PatchErrorKind::CapacityExceeded,
                      "IPS record offset " + HexOffset(off) + " exceeds 24-bit limit");
        }
        IpsRecord r;
        r.offset = static_cast<std::uint32_t>(off);
        r.rle = true;
        r.rleLength = static_cast<std::uint16_t>(chunk);
        r.rleValue = target[off];
        patch.records.push_back(std::move(r));
      }
      off += chunk;
    }
  }
  lit.flush();

  if (target.size() < source.size()) {
    patch.hasTruncation = true;
    patch.truncateSize = static_cast<std::uint32_t>(target.size());
  }

  outPatch = std::move(patch);
  return true;
}

bool SerializeIpsPatch(const IpsPatch& patch, std::vector<std::uint8_t>& outBytes, PatchError& outError)
{
  outError.clear();
  outBytes.clear();

  ByteWriter w;
  w.writeBytes(kIpsMagic, sizeof(kIpsMagic));

  for (std::size_t i = 0; i < patch.records.size(); ++i) {
    const IpsRecord& r = patch.records[i];
    if (r.offset > kIpsMaxOffset) {
      return Fail(outError, PatchErrorKind::CapacityExceeded,
                  "IPS record offset " + HexOffset(r.offset) + " exceeds 24-bit limit");
    }
    if (r.offset == kIpsEofOffset) {
      return Fail(outError, PatchErrorKind::InvalidArgument, "IPS record at offset 0x454F46 collides with EOF marker");
    }

    w.writeU24BE(r.offset);
    if (r.rle) {
      if (r.rleLength == 0) {
        return Fail(outError, PatchErrorKind::InvalidArgument, "IPS RLE record " + std::to_string(i) + " is empty");
      }
      w.writeU16BE(0);
      w.writeU16BE(r.rleLength);
      w.writeU8(r.rleValue);
    } else {
      if (r.bytes.empty()) {
        return Fail(outError, PatchErrorKind::InvalidArgument,
                    "IPS literal record " + std::to_string(i) + " is empty");
      }
      if (r.bytes.size() > kIpsMaxRecordLength) {
        return Fail(outError, PatchErrorKind::CapacityExceeded,
                    "IPS literal record " + std::to_string(i) + " exceeds 65535 bytes");
      }
      w.writeU16BE(static_cast<std::uint16_t>(r.bytes.size()));
      w.writeBytes(r.bytes.data(), r.bytes.size());
    }
  }

  w.writeBytes(kIpsEof, sizeof(kIpsEof));
  if (patch.hasTruncation) {
    if (patch.truncateSize > kIpsMaxOffset) {
      return Fail(outError, PatchErrorKind::CapacityExceeded, "IPS truncation size exceeds 24-bit limit");
    }
    w.writeU24BE(patch.truncateSize);
  }

  outBytes = std::move(w.out);
  return true;
}

bool ScanIpsPatch(const std::uint8_t* data, std::size_t size,
                  const std::function<void(const IpsRecordView&)>& onRecord, IpsTrailer& outTrailer,
                  PatchError& outError)
{
  outError.clear();
  outTrailer = IpsTrailer{};

  if (!data && size != 0) {
    return Fail(outError, PatchErrorKind::InvalidArgument, "null patch buffer");
  }

  ByteReader r{data, size, 0};

  std::uint8_t magic[5] = {};
  if (!r.readBytes(magic, sizeof(magic)) || std::memcmp(magic, kIpsMagic, sizeof(magic)) != 0) {
    return Fail(outError, PatchErrorKind::FormatError, "not an IPS patch (bad magic)");
  }

  std::size_t index = 0;
  for (;;) {
    const std::size_t recordPos = r.pos;
    std::uint32_t offset = 0;
    if (!r.readU24BE(offset)) {
      return Fail(outError, PatchErrorKind::FormatError, "IPS patch is missing its EOF terminator");
    }
    if (offset == kIpsEofOffset) break;

    std::uint16_t len = 0;
    if (!r.readU16BE(len)) {
      return Fail(outError, PatchErrorKind::FormatError,
                  "truncated IPS record " + std::to_string(index) + " at patch offset " + std::to_string(recordPos));
    }

    IpsRecordView v;
    v.offset = offset;
    if (len == 0) {
      std::uint16_t count = 0;
      if (!r.readU16BE(count) || !r.readU8(v.rleValue)) {
        return Fail(outError, PatchErrorKind::FormatError,
                    "truncated IPS RLE record " + std::to_string(index) + " at patch offset " +
                        std::to_string(recordPos));
      }
      if (count == 0) {
        return Fail(outError, PatchErrorKind::FormatError,
                    "IPS RLE record " + std::to_string(index) + " has zero length");
      }
      v.rle = true;
      v.length = count;
    } else {
      v.length = len;
      v.payload = data + r.pos;
      if (!r.skip(len)) {
        return Fail(outError, PatchErrorKind::FormatError,
                    "IPS record " + std::to_string(index) + " payload runs past end of patch");
      }
    }

    if (onRecord) onRecord(v);
    ++index;
  }

  if (r.remaining() == 3) {
    std::uint32_t truncateSize = 0;
    if (!r.readU24BE(truncateSize)) {
      return Fail(outError, PatchErrorKind::FormatError, "truncated IPS truncation size");
    }
    outTrailer.hasTruncation = true;
    outTrailer.truncateSize = truncateSize;
  } else if (r.remaining() != 0) {
    return Fail(outError, PatchErrorKind::FormatError,
                std::to_string(r.remaining()) + " unexpected trailing bytes after IPS EOF marker");
  }

  return true;
}

bool DeserializeIpsPatch(IpsPatch& outPatch, const std::uint8_t* data, std::size_t size, PatchError& outError)
{
  outPatch = IpsPatch{};

  IpsPatch patch;
  IpsTrailer trailer;
  const bool ok = ScanIpsPatch(
      data, size,
      [&](const IpsRecordView& v) {
        IpsRecord rec;
        rec.offset = v.offset;
        rec.rle = v.rle;
        if (v.rle) {
          rec.rleLength = static_cast<std::uint16_t>(v.length);
          rec.rleValue = v.rleValue;
        } else {
          rec.bytes.assign(v.payload, v.payload + v.length);
        }
        patch.records.push_back(std::move(rec));
      },
      trailer, outError);
  if (!ok) return false;

  patch.hasTruncation = trailer.hasTruncation;
  patch.truncateSize = trailer.truncateSize;
  outPatch = std::move(patch);
  return true;
}

bool ApplyIpsPatch(const std::vector<std::uint8_t>& source, const IpsPatch& patch, const IpsApplyOptions& opt,
                   std::vector<std::uint8_t>& outTarget, PatchError& outError)
{
  outError.clear();
  outTarget.clear();

  std::vector<std::uint8_t> out = source;
  for (std::size_t i = 0; i < patch.records.size(); ++i) {
    const IpsRecord& r = patch.records[i];
    if (r.offset > kIpsMaxOffset) {
      return Fail(outError, PatchErrorKind::InvalidArgument,
                  "IPS record " + std::to_string(i) + " offset exceeds 24-bit limit");
    }

    const std::size_t at = r.offset;
    const std::size_t len = r.length();
    if (at + len > out.size()) out.resize(at + len, 0);

    if (r.rle) {
      std::fill(out.begin() + static_cast<std::ptrdiff_t>(at), out.begin() + static_cast<std::ptrdiff_t>(at + len),
                r.rleValue);
    } else if (len > 0) {
      std::memcpy(out.data() + at, r.bytes.data(), len);
    }
  }

  // Truncation only ever shrinks the image.
  if (opt.honorTruncation && patch.hasTruncation && patch.truncateSize < out.size()) {
    out.resize(patch.truncateSize);
  }

  outTarget = std::move(out);
  return true;
}

} // namespace rompatch
