#include "rompatch/BpsPatch.hpp"

#include "rompatch/ByteIO.hpp"
#include "rompatch/Checksum.hpp"

#include <array>
#include <cstring>
#include <limits>
#include <new>
#include <sstream>
#include <string>
#include <utility>

namespace rompatch {

namespace {

constexpr std::uint8_t kBpsMagic[4] = {'B', 'P', 'S', '1'};
constexpr std::size_t kBpsFooterBytes = 12;
constexpr std::uint64_t kBpsMaxActionLength = (std::uint64_t{1} << 62);

std::string HexU32(std::uint32_t v)
{
  std::ostringstream oss;
  oss << "0x" << std::hex << std::uppercase;
  oss.width(8);
  oss.fill('0');
  oss << v;
  return oss.str();
}

bool HasBpsMagic(const std::uint8_t* data, std::size_t size)
{
  return data && size >= sizeof(kBpsMagic) && std::memcmp(data, kBpsMagic, sizeof(kBpsMagic)) == 0;
}

std::uint32_t ReadFooterU32(const std::uint8_t* p)
{
  return (static_cast<std::uint32_t>(p[0]) << 0) | (static_cast<std::uint32_t>(p[1]) << 8) |
         (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}

// cursor += delta, failing on underflow/overflow.
bool MoveCursor(std::uint64_t& cursor, std::int64_t delta)
{
  if (delta < 0) {
    const std::uint64_t mag = static_cast<std::uint64_t>(-(delta + 1)) + 1u;
    if (mag > cursor) return false;
    cursor -= mag;
  } else {
    const std::uint64_t mag = static_cast<std::uint64_t>(delta);
    if (cursor > std::numeric_limits<std::uint64_t>::max() - mag) return false;
    cursor += mag;
  }
  return true;
}

// Builds the command list, merging adjacent reads and tracking the copy
// cursors so relative offsets can be emitted.
struct BpsEncoder {
  BpsPatch& patch;
  std::uint64_t sourceCursor = 0;
  std::uint64_t targetCursor = 0;

  explicit BpsEncoder(BpsPatch& p) : patch(p) {}

  BpsCommand* last() { return patch.commands.empty() ? nullptr : &patch.commands.back(); }

  void sourceRead(std::uint64_t len)
  {
    BpsCommand* prev = last();
    if (prev && prev->action == BpsAction::SourceRead) {
      prev->length += len;
      return;
    }
    BpsCommand c;
    c.action = BpsAction::SourceRead;
    c.length = len;
    patch.commands.push_back(c);
  }

  void targetRead(const std::uint8_t* bytes, std::uint64_t len)
  {
    const std::uint64_t at = patch.targetData.size();
    patch.targetData.insert(patch.targetData.end(), bytes, bytes + len);

    BpsCommand* prev = last();
    if (prev && prev->action == BpsAction::TargetRead && prev->dataOffset + prev->length == at) {
      prev->length += len;
      return;
    }
    BpsCommand c;
    c.action = BpsAction::TargetRead;
    c.length = len;
    c.dataOffset = at;
    patch.commands.push_back(c);
  }

  void copy(BpsAction action, std::uint64_t& cursor, std::uint64_t from, std::uint64_t len)
  {
    BpsCommand c;
    c.action = action;
    c.length = len;
    c.relativeOffset = static_cast<std::int64_t>(from) - static_cast<std::int64_t>(cursor);
    patch.commands.push_back(c);
    cursor = from + len;
  }

  void sourceCopy(std::uint64_t from, std::uint64_t len) { copy(BpsAction::SourceCopy, sourceCursor, from, len); }
  void targetCopy(std::uint64_t from, std::uint64_t len) { copy(BpsAction::TargetCopy, targetCursor, from, len); }
};

struct RunSpan {
  std::uint64_t start = 0;
  std::uint64_t length = 0;
};

bool SourceHoldsRun(const std::vector<std::uint8_t>& source, std::uint64_t at, std::uint64_t len, std::uint8_t v)
{
  if (at + len > source.size()) return false;
  for (std::uint64_t i = 0; i < len; ++i) {
    if (source[static_cast<std::size_t>(at + i)] != v) return false;
  }
  return true;
}

// Dry run of the replay: checks every cursor and length against the source,
// the literal pool and the output written so far.
bool ValidateBpsReplay(std::uint64_t sourceSize, const BpsPatch& patch, PatchError& outError)
{
  if (patch.targetSize > static_cast<std::uint64_t>(std::numeric_limits<std::size_t>::max())) {
    return Fail(outError, PatchErrorKind::CorruptPatch,
                "BPS target size " + std::to_string(patch.targetSize) + " does not fit in memory");
  }

  const std::uint64_t literalSize = patch.targetData.size();
  std::uint64_t outPos = 0;
  std::uint64_t sourceCursor = 0;
  std::uint64_t targetCursor = 0;

  for (std::size_t i = 0; i < patch.commands.size(); ++i) {
    const BpsCommand& c = patch.commands[i];
    const std::uint64_t len = c.length;
    if (len == 0 || len > patch.targetSize - outPos) {
      return Fail(outError, PatchErrorKind::CorruptPatch,
                  "BPS action " + std::to_string(i) + " writes past the declared target size " +
                      std::to_string(patch.targetSize));
    }

    switch (c.action) {
    case BpsAction::SourceRead:
      if (outPos > sourceSize || len > sourceSize - outPos) {
        return Fail(outError, PatchErrorKind::CorruptPatch,
                    "BPS action " + std::to_string(i) + " reads past end of source");
      }
      break;

    case BpsAction::TargetRead:
      if (c.dataOffset > literalSize || len > literalSize - c.dataOffset) {
        return Fail(outError, PatchErrorKind::CorruptPatch,
                    "BPS action " + std::to_string(i) + " references missing literal data");
      }
      break;

    case BpsAction::SourceCopy:
      if (!MoveCursor(sourceCursor, c.relativeOffset) || sourceCursor > sourceSize ||
          len > sourceSize - sourceCursor) {
        return Fail(outError, PatchErrorKind::CorruptPatch,
                    "BPS action " + std::to_string(i) + " copies outside the source");
      }
      sourceCursor += len;
      break;

    case BpsAction::TargetCopy:
      if (!MoveCursor(targetCursor, c.relativeOffset) || targetCursor >= outPos) {
        return Fail(outError, PatchErrorKind::CorruptPatch,
                    "BPS action " + std::to_string(i) + " copies from unwritten output");
      }
      targetCursor += len;
      break;
    }

    outPos += len;
  }

  if (outPos != patch.targetSize) {
    return Fail(outError, PatchErrorKind::CorruptPatch,
                "BPS actions write " + std::to_string(outPos) + " bytes, header declares " +
                    std::to_string(patch.targetSize));
  }
  return true;
}

} // namespace

const char* BpsActionName(BpsAction a)
{
  switch (a) {
  case BpsAction::SourceRead: return "source_read";
  case BpsAction::TargetRead: return "target_read";
  case BpsAction::SourceCopy: return "source_copy";
  case BpsAction::TargetCopy: return "target_copy";
  }
  return "unknown";
}

bool EncodeBpsPatch(const std::vector<std::uint8_t>& source, const std::vector<std::uint8_t>& target,
                    const std::vector<EditOperation>& ops, const std::vector<std::uint8_t>& metadata,
                    BpsPatch& outPatch, PatchError& outError)
{
  outError.clear();
  outPatch = BpsPatch{};

  if (!ValidateEditOperations(ops, target.size(), outError)) return false;

  BpsPatch patch;
  patch.sourceSize = source.size();
  patch.targetSize = target.size();
  patch.metadata = metadata;
  patch.sourceCrc32 = Crc32(source);
  patch.targetCrc32 = Crc32(target);

  BpsEncoder enc(patch);
  // Longest run already written per byte value, for reuse by later runs.
  std::array<RunSpan, 256> longestRun{};
  for (const EditOperation& op : ops) {
    const std::uint64_t pos = op.targetOffset;
    const std::uint64_t len = op.length;

    switch (op.kind) {
    case EditKind::Literal:
      enc.targetRead(op.bytes.data(), len);
      break;

    case EditKind::CopyFromSource:
      if (op.fromOffset + len > source.size()) {
        return Fail(outError, PatchErrorKind::InvalidArgument,
                    "source copy at target offset " + std::to_string(pos) + " reads past end of source");
      }
      if (op.fromOffset == pos) {
        enc.sourceRead(len);
      } else {
        enc.sourceCopy(op.fromOffset, len);
      }
      break;

    case EditKind::CopyFromTarget:
      enc.targetCopy(op.fromOffset, len);
      break;

    case EditKind::Run: {
      RunSpan& seen = longestRun[op.value];
      if (SourceHoldsRun(source, pos, len, op.value)) {
        enc.sourceRead(len);
      } else if (pos > 0 && target[static_cast<std::size_t>(pos - 1)] == op.value) {
        // Self-overlapping copy of the previous output byte.
        enc.targetCopy(pos - 1, len);
      } else if (seen.length >= len) {
        enc.targetCopy(seen.start, len);
      } else {
        enc.targetRead(&op.value, 1);
        if (len > 1) enc.targetCopy(pos, len - 1);
      }
      if (len > seen.length) seen = RunSpan{pos, len};
      break;
    }
    }
  }

  outPatch = std::move(patch);
  return true;
}

bool SerializeBpsPatch(const BpsPatch& patch, std::vector<std::uint8_t>& outBytes, PatchError& outError)
{
  outError.clear();
  outBytes.clear();

  ByteWriter w;
  w.writeBytes(kBpsMagic, sizeof(kBpsMagic));
  w.writeBpsNumber(patch.sourceSize);
  w.writeBpsNumber(patch.targetSize);
  w.writeBpsNumber(patch.metadata.size());
  w.writeBytes(patch.metadata.data(), patch.metadata.size());

  for (std::size_t i = 0; i < patch.commands.size(); ++i) {
    const BpsCommand& c = patch.commands[i];
    if (c.length == 0 || c.length > kBpsMaxActionLength) {
      return Fail(outError, PatchErrorKind::InvalidArgument,
                  "BPS action " + std::to_string(i) + " has invalid length " + std::to_string(c.length));
    }

    w.writeBpsNumber(((c.length - 1u) << 2) | static_cast<std::uint64_t>(c.action));
    switch (c.action) {
    case BpsAction::SourceRead: break;
    case BpsAction::TargetRead:
      if (c.dataOffset > patch.targetData.size() || c.length > patch.targetData.size() - c.dataOffset) {
        return Fail(outError, PatchErrorKind::InvalidArgument,
                    "BPS action " + std::to_string(i) + " references missing literal data");
      }
      w.writeBytes(patch.targetData.data() + c.dataOffset, static_cast<std::size_t>(c.length));
      break;
    case BpsAction::SourceCopy:
    case BpsAction::TargetCopy: w.writeBpsSigned(c.relativeOffset); break;
    }
  }

  w.writeU32LE(patch.sourceCrc32);
  w.writeU32LE(patch.targetCrc32);
  w.writeU32LE(Crc32(w.out));

  outBytes = std::move(w.out);
  return true;
}

bool ScanBpsPatch(const std::uint8_t* data, std::size_t size,
                  const std::function<void(const BpsCommandView&)>& onCommand, BpsHeader& outHeader,
                  PatchError& outError)
{
  outError.clear();
  outHeader = BpsHeader{};

  if (!HasBpsMagic(data, size)) {
    return Fail(outError, PatchErrorKind::FormatError, "not a BPS patch (bad magic)");
  }
  if (size < kBpsMinPatchSize) {
    return Fail(outError, PatchErrorKind::FormatError,
                "BPS patch too small (" + std::to_string(size) + " bytes)");
  }

  const std::size_t footerPos = size - kBpsFooterBytes;
  BpsHeader h;
  h.sourceCrc32 = ReadFooterU32(data + footerPos + 0);
  h.targetCrc32 = ReadFooterU32(data + footerPos + 4);
  h.patchCrc32 = ReadFooterU32(data + footerPos + 8);
  h.computedPatchCrc32 = Crc32(data, size - 4);

  // The reader stops at the footer so no action can consume it.
  ByteReader r{data, footerPos, sizeof(kBpsMagic)};
  if (!r.readBpsNumber(h.sourceSize) || !r.readBpsNumber(h.targetSize) || !r.readBpsNumber(h.metadataSize)) {
    return Fail(outError, PatchErrorKind::FormatError, "malformed BPS header");
  }
  if (h.metadataSize > r.remaining()) {
    return Fail(outError, PatchErrorKind::FormatError,
                "BPS metadata size " + std::to_string(h.metadataSize) + " runs past the action stream");
  }
  h.metadataOffset = r.pos;
  r.skip(static_cast<std::size_t>(h.metadataSize));

  std::size_t index = 0;
  while (r.remaining() > 0) {
    const std::size_t actionPos = r.pos;
    std::uint64_t n = 0;
    if (!r.readBpsNumber(n)) {
      return Fail(outError, PatchErrorKind::FormatError,
                  "malformed BPS action " + std::to_string(index) + " at patch offset " + std::to_string(actionPos));
    }

    BpsCommandView v;
    v.action = static_cast<BpsAction>(n & 3u);
    v.length = (n >> 2) + 1u;

    switch (v.action) {
    case BpsAction::SourceRead: break;
    case BpsAction::TargetRead:
      if (v.length > r.remaining()) {
        return Fail(outError, PatchErrorKind::FormatError,
                    "BPS action " + std::to_string(index) + " literal data runs past the footer");
      }
      v.data = data + r.pos;
      r.skip(static_cast<std::size_t>(v.length));
      break;
    case BpsAction::SourceCopy:
    case BpsAction::TargetCopy:
      if (!r.readBpsSigned(v.relativeOffset)) {
        return Fail(outError, PatchErrorKind::FormatError,
                    "malformed BPS copy offset in action " + std::to_string(index));
      }
      break;
    }

    if (onCommand) onCommand(v);
    ++index;
  }

  outHeader = h;
  return true;
}

bool DeserializeBpsPatch(BpsPatch& outPatch, const std::uint8_t* data, std::size_t size, PatchError& outError)
{
  outError.clear();
  outPatch = BpsPatch{};

  if (!HasBpsMagic(data, size)) {
    return Fail(outError, PatchErrorKind::FormatError, "not a BPS patch (bad magic)");
  }
  if (size < kBpsMinPatchSize) {
    return Fail(outError, PatchErrorKind::FormatError,
                "BPS patch too small (" + std::to_string(size) + " bytes)");
  }

  const std::uint32_t stored = ReadFooterU32(data + size - 4);
  const std::uint32_t computed = Crc32(data, size - 4);
  if (stored != computed) {
    return Fail(outError, PatchErrorKind::CorruptPatch,
                "BPS patch CRC mismatch (stored " + HexU32(stored) + ", computed " + HexU32(computed) + ")");
  }

  BpsPatch patch;
  BpsHeader h;
  const bool ok = ScanBpsPatch(
      data, size,
      [&](const BpsCommandView& v) {
        BpsCommand c;
        c.action = v.action;
        c.length = v.length;
        c.relativeOffset = v.relativeOffset;
        if (v.action == BpsAction::TargetRead) {
          c.dataOffset = patch.targetData.size();
          patch.targetData.insert(patch.targetData.end(), v.data, v.data + v.length);
        }
        patch.commands.push_back(c);
      },
      h, outError);
  if (!ok) return false;

  patch.sourceSize = h.sourceSize;
  patch.targetSize = h.targetSize;
  patch.metadata.assign(data + h.metadataOffset, data + h.metadataOffset + h.metadataSize);
  patch.sourceCrc32 = h.sourceCrc32;
  patch.targetCrc32 = h.targetCrc32;
  patch.patchCrc32 = h.patchCrc32;

  outPatch = std::move(patch);
  return true;
}

bool ApplyBpsPatch(const std::vector<std::uint8_t>& source, const BpsPatch& patch,
                   std::vector<std::uint8_t>& outTarget, PatchError& outError)
{
  outError.clear();
  outTarget.clear();

  if (source.size() != patch.sourceSize) {
    return Fail(outError, PatchErrorKind::SourceMismatch,
                "source size mismatch (patch expects " + std::to_string(patch.sourceSize) + " bytes, got " +
                    std::to_string(source.size()) + ")");
  }
  const std::uint32_t sourceCrc = Crc32(source);
  if (sourceCrc != patch.sourceCrc32) {
    return Fail(outError, PatchErrorKind::SourceMismatch,
                "source CRC mismatch (patch expects " + HexU32(patch.sourceCrc32) + ", got " + HexU32(sourceCrc) +
                    ")");
  }

  // Walk the actions once without touching any data: every read and copy must
  // stay in bounds and the actions must produce exactly targetSize bytes.
  // Nothing is allocated until this passes.
  if (!ValidateBpsReplay(source.size(), patch, outError)) return false;

  std::vector<std::uint8_t> out;
  try {
    out.resize(static_cast<std::size_t>(patch.targetSize));
  } catch (const std::bad_alloc&) {
    return Fail(outError, PatchErrorKind::CorruptPatch,
                "cannot allocate " + std::to_string(patch.targetSize) + " byte BPS target");
  }

  std::uint64_t outPos = 0;
  std::uint64_t sourceCursor = 0;
  std::uint64_t targetCursor = 0;

  for (const BpsCommand& c : patch.commands) {
    const std::size_t len = static_cast<std::size_t>(c.length);
    const std::size_t at = static_cast<std::size_t>(outPos);

    switch (c.action) {
    case BpsAction::SourceRead:
      std::memcpy(out.data() + at, source.data() + at, len);
      break;

    case BpsAction::TargetRead:
      std::memcpy(out.data() + at, patch.targetData.data() + c.dataOffset, len);
      break;

    case BpsAction::SourceCopy:
      (void)MoveCursor(sourceCursor, c.relativeOffset);
      std::memcpy(out.data() + at, source.data() + sourceCursor, len);
      sourceCursor += c.length;
      break;

    case BpsAction::TargetCopy:
      // Byte by byte: the copy may overlap the bytes it is producing.
      (void)MoveCursor(targetCursor, c.relativeOffset);
      for (std::size_t k = 0; k < len; ++k) {
        out[at + k] = out[static_cast<std::size_t>(targetCursor) + k];
      }
      targetCursor += c.length;
      break;
    }

    outPos += c.length;
  }

  const std::uint32_t targetCrc = Crc32(out);
  if (targetCrc != patch.targetCrc32) {
    return Fail(outError, PatchErrorKind::CorruptPatch,
                "target CRC mismatch (patch expects " + HexU32(patch.targetCrc32) + ", got " + HexU32(targetCrc) +
                    ")");
  }

  outTarget = std::move(out);
  return true;
}

} // namespace rompatch
