#include "rompatch/BinaryDiff.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <sstream>
#include <utility>
#include <vector>

namespace rompatch {

namespace {

constexpr std::size_t kHashBits = 16;
constexpr std::size_t kHashSize = std::size_t{1} << kHashBits;
constexpr std::size_t kSeedBytes = 4; // bytes hashed per chain entry
constexpr std::size_t kNoPos = std::numeric_limits<std::size_t>::max();

inline std::uint32_t Hash4(const std::uint8_t* p)
{
  const std::uint32_t v = (static_cast<std::uint32_t>(p[0]) << 24u) |
                          (static_cast<std::uint32_t>(p[1]) << 16u) |
                          (static_cast<std::uint32_t>(p[2]) << 8u) |
                          (static_cast<std::uint32_t>(p[3]));
  std::uint32_t x = v * 2654435761u;
  x ^= x >> 15;
  x *= 2246822519u;
  x ^= x >> 13;
  return x & static_cast<std::uint32_t>(kHashSize - 1u);
}

// Hash chain over one buffer. Positions are inserted in ascending order, so a
// walk from head[] visits candidates from nearest-behind to farthest.
struct HashChain {
  const std::vector<std::uint8_t>* bytes = nullptr;
  std::vector<std::size_t> head;
  std::vector<std::size_t> prev;

  explicit HashChain(const std::vector<std::uint8_t>& b)
      : bytes(&b), head(kHashSize, kNoPos), prev(b.size(), kNoPos)
  {
  }

  void insert(std::size_t pos)
  {
    if (pos + kSeedBytes > bytes->size()) return;
    const std::uint32_t h = Hash4(bytes->data() + pos);
    prev[pos] = head[h];
    head[h] = pos;
  }
};

inline std::uint64_t Distance(std::size_t a, std::size_t b)
{
  return (a > b) ? static_cast<std::uint64_t>(a - b) : static_cast<std::uint64_t>(b - a);
}

std::size_t MatchLength(const std::vector<std::uint8_t>& ref, std::size_t refPos,
                        const std::vector<std::uint8_t>& target, std::size_t pos)
{
  std::size_t len = 0;
  while (refPos + len < ref.size() && pos + len < target.size() && ref[refPos + len] == target[pos + len]) {
    ++len;
  }
  return len;
}

struct Match {
  std::size_t offset = 0;
  std::size_t length = 0;
};

Match FindSourceMatch(const std::vector<std::uint8_t>& source, const HashChain& chain,
                      const std::vector<std::uint8_t>& target, std::size_t pos, std::size_t sourceCursor,
                      const DiffOptions& opt)
{
  Match best;
  const auto consider = [&](std::size_t cand) {
    if (cand >= source.size()) return;
    const std::size_t len = MatchLength(source, cand, target, pos);
    if (len > best.length) {
      best.offset = cand;
      best.length = len;
    }
  };

  // Same offset first (the common case for in-place ROM edits), then the
  // continuation of the previous source copy.
  consider(pos);
  if (sourceCursor != pos) consider(sourceCursor);

  if (pos + kSeedBytes > target.size()) return best;

  const std::uint32_t h = Hash4(target.data() + pos);
  std::size_t cand = chain.head[h];
  for (int step = 0; cand != kNoPos && step < opt.maxChainSteps; ++step) {
    if (cand < pos && pos - cand > opt.searchWindow) break; // chain is descending, the rest is out of window
    if (Distance(cand, pos) <= opt.searchWindow && cand != pos && cand != sourceCursor) {
      consider(cand);
    }
    cand = chain.prev[cand];
  }
  return best;
}

Match FindTargetMatch(const HashChain& chain, const std::vector<std::uint8_t>& target, std::size_t pos,
                      const DiffOptions& opt)
{
  Match best;
  if (pos + kSeedBytes > target.size()) return best;

  const std::uint32_t h = Hash4(target.data() + pos);
  std::size_t cand = chain.head[h];
  for (int step = 0; cand != kNoPos && step < opt.maxChainSteps; ++step) {
    if (pos - cand > opt.searchWindow) break;

    // Overlap (cand + len > pos) is fine: replay copies byte by byte.
    const std::size_t len = MatchLength(target, cand, target, pos);
    if (len > best.length) {
      best.offset = cand;
      best.length = len;
    }
    cand = chain.prev[cand];
  }
  return best;
}

std::size_t RunLength(const std::vector<std::uint8_t>& target, std::size_t pos)
{
  const std::uint8_t v = target[pos];
  std::size_t len = 1;
  while (pos + len < target.size() && target[pos + len] == v) ++len;
  return len;
}

void FlushLiteral(std::vector<EditOperation>& ops, std::vector<std::uint8_t>& pending, std::size_t endPos)
{
  if (pending.empty()) return;
  EditOperation op;
  op.kind = EditKind::Literal;
  op.length = pending.size();
  op.targetOffset = static_cast<std::uint64_t>(endPos - pending.size());
  op.bytes = std::move(pending);
  ops.push_back(std::move(op));
  pending.clear();
}

} // namespace

const char* EditKindName(EditKind kind)
{
  switch (kind) {
  case EditKind::Literal: return "literal";
  case EditKind::Run: return "run";
  case EditKind::CopyFromSource: return "copy_from_source";
  case EditKind::CopyFromTarget: return "copy_from_target";
  }
  return "unknown";
}

bool ValidateDiffOptions(const DiffOptions& opt, PatchError& outError)
{
  if (opt.searchWindow == 0) {
    return Fail(outError, PatchErrorKind::InvalidArgument, "search window must be > 0");
  }
  if (opt.maxChainSteps < 1) {
    return Fail(outError, PatchErrorKind::InvalidArgument, "max chain steps must be >= 1");
  }
  if (opt.minCopyLength < 1) {
    return Fail(outError, PatchErrorKind::InvalidArgument, "min copy length must be >= 1");
  }
  if (opt.minRunLength < 2) {
    return Fail(outError, PatchErrorKind::InvalidArgument, "min run length must be >= 2");
  }
  return true;
}

bool DiffBuffers(const std::vector<std::uint8_t>& source, const std::vector<std::uint8_t>& target,
                 const DiffOptions& opt, std::vector<EditOperation>& outOps, PatchError& outError)
{
  outError.clear();
  outOps.clear();

  if (!ValidateDiffOptions(opt, outError)) return false;
  if (target.empty()) return true;

  HashChain sourceChain(source);
  for (std::size_t i = 0; i < source.size(); ++i) {
    sourceChain.insert(i);
  }
  HashChain targetChain(target);

  std::vector<std::uint8_t> pending;
  std::size_t sourceCursor = 0;
  std::size_t pos = 0;

  while (pos < target.size()) {
    const std::size_t runLen = RunLength(target, pos);
    const Match src = FindSourceMatch(source, sourceChain, target, pos, sourceCursor, opt);
    const Match tgt = FindTargetMatch(targetChain, target, pos, opt);

    const std::size_t runOk = (runLen >= opt.minRunLength) ? runLen : 0;
    // An unchanged tail shorter than minCopyLength is still taken from the
    // source, so identical inputs never produce literals.
    const bool srcTail = (src.offset == pos) && (pos + src.length == target.size());
    const std::size_t srcOk = (src.length >= opt.minCopyLength || (srcTail && src.length > 0)) ? src.length : 0;
    const std::size_t tgtOk = (tgt.length >= opt.minCopyLength) ? tgt.length : 0;

    if (runOk == 0 && srcOk == 0 && tgtOk == 0) {
      pending.push_back(target[pos]);
      targetChain.insert(pos);
      ++pos;
      continue;
    }

    FlushLiteral(outOps, pending, pos);

    EditOperation op;
    op.targetOffset = pos;
    if (runOk >= srcOk && runOk >= tgtOk) {
      op.kind = EditKind::Run;
      op.length = runOk;
      op.value = target[pos];
    } else if (srcOk >= tgtOk) {
      op.kind = EditKind::CopyFromSource;
      op.length = srcOk;
      op.fromOffset = src.offset;
      sourceCursor = src.offset + srcOk;
    } else {
      op.kind = EditKind::CopyFromTarget;
      op.length = tgtOk;
      op.fromOffset = tgt.offset;
    }

    const std::size_t len = static_cast<std::size_t>(op.length);
    for (std::size_t k = 0; k < len; ++k) {
      targetChain.insert(pos + k);
    }
    pos += len;
    outOps.push_back(std::move(op));
  }

  FlushLiteral(outOps, pending, pos);
  return true;
}

bool ValidateEditOperations(const std::vector<EditOperation>& ops, std::uint64_t targetSize, PatchError& outError)
{
  outError.clear();

  std::uint64_t expected = 0;
  for (std::size_t i = 0; i < ops.size(); ++i) {
    const EditOperation& op = ops[i];
    if (op.targetOffset != expected || op.length == 0) {
      std::ostringstream oss;
      oss << "edit operation " << i << " (" << EditKindName(op.kind) << ") is not contiguous at offset "
          << op.targetOffset << " (expected " << expected << ")";
      return Fail(outError, PatchErrorKind::InvalidArgument, oss.str());
    }
    if (op.kind == EditKind::Literal && op.bytes.size() != op.length) {
      return Fail(outError, PatchErrorKind::InvalidArgument, "literal operation length does not match its bytes");
    }
    if (op.kind == EditKind::CopyFromTarget && op.fromOffset >= op.targetOffset) {
      return Fail(outError, PatchErrorKind::InvalidArgument, "target copy must reference earlier output");
    }
    expected += op.length;
  }

  if (expected != targetSize) {
    std::ostringstream oss;
    oss << "edit operations cover " << expected << " bytes, target has " << targetSize;
    return Fail(outError, PatchErrorKind::InvalidArgument, oss.str());
  }
  return true;
}

EditStats SummarizeEditOperations(const std::vector<EditOperation>& ops)
{
  EditStats s;
  for (const EditOperation& op : ops) {
    switch (op.kind) {
    case EditKind::Literal:
      ++s.literalOps;
      s.literalBytes += op.length;
      break;
    case EditKind::Run:
      ++s.runOps;
      s.runBytes += op.length;
      break;
    case EditKind::CopyFromSource:
      ++s.sourceCopyOps;
      s.sourceCopyBytes += op.length;
      break;
    case EditKind::CopyFromTarget:
      ++s.targetCopyOps;
      s.targetCopyBytes += op.length;
      break;
    }
  }
  return s;
}

} // namespace rompatch
