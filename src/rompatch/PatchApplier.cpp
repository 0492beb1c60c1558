#include "rompatch/PatchApplier.hpp"

#include "rompatch/BpsPatch.hpp"
#include "rompatch/IpsPatch.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <utility>

namespace rompatch {

const char* PatchFormatName(PatchFormat f)
{
  switch (f) {
  case PatchFormat::Ips: return "ips";
  case PatchFormat::Bps: return "bps";
  case PatchFormat::Unknown: break;
  }
  return "unknown";
}

bool ParsePatchFormat(const std::string& s, PatchFormat& out)
{
  std::string t = s;
  for (char& c : t) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (t == "ips" || t == "simple") {
    out = PatchFormat::Ips;
    return true;
  }
  if (t == "bps" || t == "delta") {
    out = PatchFormat::Bps;
    return true;
  }
  return false;
}

PatchFormat DetectPatchFormat(const std::uint8_t* data, std::size_t size)
{
  if (!data) return PatchFormat::Unknown;
  if (size >= 5 && std::memcmp(data, "PATCH", 5) == 0) return PatchFormat::Ips;
  if (size >= 4 && std::memcmp(data, "BPS1", 4) == 0) return PatchFormat::Bps;
  return PatchFormat::Unknown;
}

bool CreatePatch(const std::vector<std::uint8_t>& source, const std::vector<std::uint8_t>& target,
                 const PatchCreateOptions& opt, std::vector<std::uint8_t>& outPatch, PatchError& outError)
{
  outError.clear();
  outPatch.clear();

  std::vector<EditOperation> ops;
  if (!DiffBuffers(source, target, opt.diff, ops, outError)) return false;

  switch (opt.format) {
  case PatchFormat::Ips: {
    if (!opt.metadata.empty()) {
      return Fail(outError, PatchErrorKind::InvalidArgument, "IPS patches cannot carry metadata");
    }
    IpsEncodeOptions ipsOpt;
    ipsOpt.minRleLength = opt.minRleLength;
    IpsPatch patch;
    if (!EncodeIpsPatch(source, target, ops, ipsOpt, patch, outError)) return false;
    return SerializeIpsPatch(patch, outPatch, outError);
  }
  case PatchFormat::Bps: {
    BpsPatch patch;
    if (!EncodeBpsPatch(source, target, ops, opt.metadata, patch, outError)) return false;
    return SerializeBpsPatch(patch, outPatch, outError);
  }
  case PatchFormat::Unknown: break;
  }
  return Fail(outError, PatchErrorKind::InvalidArgument, "unknown patch format");
}

bool ApplyPatch(const std::vector<std::uint8_t>& source, const std::vector<std::uint8_t>& patchBytes,
                const ApplyOptions& opt, std::vector<std::uint8_t>& outTarget, PatchError& outError)
{
  outError.clear();
  outTarget.clear();

  switch (DetectPatchFormat(patchBytes)) {
  case PatchFormat::Ips: {
    IpsPatch patch;
    if (!DeserializeIpsPatch(patch, patchBytes.data(), patchBytes.size(), outError)) return false;
    IpsApplyOptions ipsOpt;
    ipsOpt.honorTruncation = opt.honorTruncation;
    return ApplyIpsPatch(source, patch, ipsOpt, outTarget, outError);
  }
  case PatchFormat::Bps: {
    BpsPatch patch;
    if (!DeserializeBpsPatch(patch, patchBytes.data(), patchBytes.size(), outError)) return false;
    return ApplyBpsPatch(source, patch, outTarget, outError);
  }
  case PatchFormat::Unknown: break;
  }
  return Fail(outError, PatchErrorKind::FormatError, "unrecognized patch format (expected IPS or BPS magic)");
}

bool VerifyPatch(const std::vector<std::uint8_t>& source, const std::vector<std::uint8_t>& patchBytes,
                 const std::vector<std::uint8_t>& expectedTarget, bool& outMatches,
                 std::uint64_t& outFirstDifference, PatchError& outError)
{
  outMatches = false;
  outFirstDifference = 0;

  std::vector<std::uint8_t> out;
  if (!ApplyPatch(source, patchBytes, ApplyOptions{}, out, outError)) return false;

  const std::size_t n = std::min(out.size(), expectedTarget.size());
  const auto mm = std::mismatch(out.begin(), out.begin() + static_cast<std::ptrdiff_t>(n), expectedTarget.begin());
  outFirstDifference = static_cast<std::uint64_t>(mm.first - out.begin());
  outMatches = (outFirstDifference == n) && (out.size() == expectedTarget.size());
  return true;
}

} // namespace rompatch
