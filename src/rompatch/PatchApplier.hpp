#pragma once

#include "rompatch/BinaryDiff.hpp"
#include "rompatch/PatchError.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace rompatch {

// Format-agnostic entry points used by the CLI.
//
// The set of formats is closed; each codec exposes the same
// Encode/Serialize/Deserialize/Apply quartet and this layer just switches on
// PatchFormat.

enum class PatchFormat : std::uint8_t {
  Unknown = 0,
  Ips = 1,
  Bps = 2,
};

// "ips", "bps" or "unknown".
const char* PatchFormatName(PatchFormat f);

// Case-insensitive "ips"/"bps", or the aliases "simple" (IPS) and "delta"
// (BPS). Returns false for anything else.
bool ParsePatchFormat(const std::string& s, PatchFormat& out);

// Sniffs the magic bytes ("PATCH" / "BPS1").
PatchFormat DetectPatchFormat(const std::uint8_t* data, std::size_t size);

inline PatchFormat DetectPatchFormat(const std::vector<std::uint8_t>& bytes)
{
  return DetectPatchFormat(bytes.data(), bytes.size());
}

struct PatchCreateOptions {
  PatchFormat format = PatchFormat::Ips;
  DiffOptions diff{};

  // IPS only.
  std::uint64_t minRleLength = 4;

  // BPS only: stored verbatim in the patch header.
  std::vector<std::uint8_t> metadata;
};

struct ApplyOptions {
  // IPS only: resize the output to the truncation size stored after "EOF".
  bool honorTruncation = true;
};

// Diff, encode and serialize in one step.
bool CreatePatch(const std::vector<std::uint8_t>& source, const std::vector<std::uint8_t>& target,
                 const PatchCreateOptions& opt, std::vector<std::uint8_t>& outPatch, PatchError& outError);

// Detect the format, deserialize and apply. outTarget is left empty on failure.
bool ApplyPatch(const std::vector<std::uint8_t>& source, const std::vector<std::uint8_t>& patchBytes,
                const ApplyOptions& opt, std::vector<std::uint8_t>& outTarget, PatchError& outError);

// Apply the patch and compare the result with `expectedTarget`.
//
// Returns false only when the patch cannot be applied (outError is set).
// A successful apply that produces different bytes returns true with
// outMatches == false and outFirstDifference set to the first differing offset
// (or the shorter length when one output is a prefix of the other).
bool VerifyPatch(const std::vector<std::uint8_t>& source, const std::vector<std::uint8_t>& patchBytes,
                 const std::vector<std::uint8_t>& expectedTarget, bool& outMatches,
                 std::uint64_t& outFirstDifference, PatchError& outError);

} // namespace rompatch
