#pragma once

#include "rompatch/PatchError.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace rompatch {

// Abstract edit operations produced by DiffBuffers() and consumed by both patch
// codecs.
//
// Operations are ordered by ascending targetOffset, contiguous and
// non-overlapping: op[i+1].targetOffset == op[i].targetOffset + op[i].length,
// and the lengths sum to the target size.
enum class EditKind : std::uint8_t {
  Literal = 0,        // target bytes with no useful relationship to the source
  Run = 1,            // `length` copies of `value`
  CopyFromSource = 2, // source[fromOffset .. fromOffset+length)
  CopyFromTarget = 3, // target[fromOffset .. fromOffset+length), fromOffset < targetOffset
};

struct EditOperation {
  EditKind kind = EditKind::Literal;

  std::uint64_t targetOffset = 0;
  std::uint64_t length = 0;

  // CopyFromSource / CopyFromTarget only.
  std::uint64_t fromOffset = 0;

  // Run only.
  std::uint8_t value = 0;

  // Literal only (bytes.size() == length).
  std::vector<std::uint8_t> bytes;
};

const char* EditKindName(EditKind kind);

struct DiffOptions {
  // Maximum distance (in bytes) between the current target position and a
  // source/target match candidate.
  std::uint64_t searchWindow = 1u << 20;

  // Maximum number of hash-chain entries visited per position and buffer.
  int maxChainSteps = 64;

  // Shorter matches cost more to encode than the literal bytes they replace.
  std::uint64_t minCopyLength = 4;
  std::uint64_t minRunLength = 4;
};

// Validate option ranges. Fills outError with InvalidArgument on failure.
bool ValidateDiffOptions(const DiffOptions& opt, PatchError& outError);

// Greedy bounded-window diff.
//
// Scans `target` left to right; at each position the longest of
//   (a) a run of one repeated byte,
//   (b) a match in `source` near the same offset (or continuing the previous
//       source copy),
//   (c) a match in already-scanned target bytes,
// is taken if it reaches the minimum profitable length (ties prefer a, then b,
// then c). Otherwise the byte is appended to the pending literal.
//
// The output is deterministic for identical inputs.
bool DiffBuffers(const std::vector<std::uint8_t>& source, const std::vector<std::uint8_t>& target,
                 const DiffOptions& opt, std::vector<EditOperation>& outOps, PatchError& outError);

// Check the ordering/contiguity invariant against a target size.
bool ValidateEditOperations(const std::vector<EditOperation>& ops, std::uint64_t targetSize, PatchError& outError);

struct EditStats {
  std::size_t literalOps = 0;
  std::size_t runOps = 0;
  std::size_t sourceCopyOps = 0;
  std::size_t targetCopyOps = 0;

  std::uint64_t literalBytes = 0;
  std::uint64_t runBytes = 0;
  std::uint64_t sourceCopyBytes = 0;
  std::uint64_t targetCopyBytes = 0;
};

EditStats SummarizeEditOperations(const std::vector<EditOperation>& ops);

} // namespace rompatch
