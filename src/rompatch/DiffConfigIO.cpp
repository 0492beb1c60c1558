#include "rompatch/DiffConfigIO.hpp"

#include "rompatch/FileIO.hpp"

#include <cmath>
#include <limits>
#include <sstream>

namespace rompatch {

namespace {

// Largest integer a double holds exactly.
constexpr double kMaxExactDouble = 9007199254740992.0;

bool ReadU64(const JsonValue& root, const char* key, std::uint64_t maxValue, std::uint64_t& io,
             PatchError& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true; // missing => keep
  if (!v->isNumber()) {
    return Fail(err, PatchErrorKind::InvalidArgument, std::string("expected number for key '") + key + "'");
  }
  const double d = v->numberValue;
  if (!std::isfinite(d) || d < 0.0 || d != std::floor(d) || d > kMaxExactDouble) {
    return Fail(err, PatchErrorKind::InvalidArgument,
                std::string("expected non-negative integer for key '") + key + "'");
  }
  const std::uint64_t u = static_cast<std::uint64_t>(d);
  if (u > maxValue) {
    return Fail(err, PatchErrorKind::InvalidArgument,
                std::string("value for key '") + key + "' is out of range (max " + std::to_string(maxValue) + ")");
  }
  io = u;
  return true;
}

} // namespace

std::string DiffConfigToJson(const DiffConfig& cfg, int indentSpaces)
{
  std::ostringstream oss;
  JsonWriteOptions opt;
  opt.indent = indentSpaces;
  JsonWriter w(oss, opt);

  const bool ok = w.beginObject() &&
                  w.key("search_window") && w.uintValue(cfg.diff.searchWindow) &&
                  w.key("max_chain_steps") && w.intValue(cfg.diff.maxChainSteps) &&
                  w.key("min_copy_length") && w.uintValue(cfg.diff.minCopyLength) &&
                  w.key("min_run_length") && w.uintValue(cfg.diff.minRunLength) &&
                  w.key("min_rle_length") && w.uintValue(cfg.minRleLength) &&
                  w.endObject() && w.finish();
  if (!ok) return std::string();
  return oss.str();
}

bool ApplyDiffConfigJson(const JsonValue& root, DiffConfig& ioCfg, PatchError& outError)
{
  outError.clear();
  if (!root.isObject()) {
    return Fail(outError, PatchErrorKind::InvalidArgument, "diff config must be a JSON object");
  }

  // Apply into a copy so a bad key leaves ioCfg untouched.
  DiffConfig cfg = ioCfg;
  std::uint64_t chainSteps = static_cast<std::uint64_t>(cfg.diff.maxChainSteps);

  constexpr std::uint64_t kU64Max = std::numeric_limits<std::uint64_t>::max();
  if (!ReadU64(root, "search_window", kU64Max, cfg.diff.searchWindow, outError)) return false;
  if (!ReadU64(root, "max_chain_steps", static_cast<std::uint64_t>(std::numeric_limits<int>::max()), chainSteps,
               outError)) {
    return false;
  }
  if (!ReadU64(root, "min_copy_length", kU64Max, cfg.diff.minCopyLength, outError)) return false;
  if (!ReadU64(root, "min_run_length", kU64Max, cfg.diff.minRunLength, outError)) return false;
  if (!ReadU64(root, "min_rle_length", 0xFFFFu, cfg.minRleLength, outError)) return false;
  cfg.diff.maxChainSteps = static_cast<int>(chainSteps);

  if (!ValidateDiffOptions(cfg.diff, outError)) return false;
  if (cfg.minRleLength < 1) {
    return Fail(outError, PatchErrorKind::InvalidArgument, "min_rle_length must be >= 1");
  }

  ioCfg = cfg;
  return true;
}

bool LoadDiffConfigJsonFile(const std::string& path, DiffConfig& ioCfg, PatchError& outError)
{
  std::string text;
  if (!ReadFileText(path, text, outError)) return false;

  JsonValue root;
  std::string jsonErr;
  if (!ParseJson(text, root, jsonErr)) {
    return Fail(outError, PatchErrorKind::InvalidArgument, path + ": " + jsonErr);
  }

  if (!ApplyDiffConfigJson(root, ioCfg, outError)) {
    outError.message = path + ": " + outError.message;
    return false;
  }
  return true;
}

bool WriteDiffConfigJsonFile(const std::string& path, const DiffConfig& cfg, PatchError& outError,
                             int indentSpaces)
{
  return WriteFileTextAtomic(path, DiffConfigToJson(cfg, indentSpaces), outError);
}

} // namespace rompatch
