#pragma once

#include "rompatch/BinaryDiff.hpp"
#include "rompatch/Json.hpp"
#include "rompatch/PatchError.hpp"

#include <cstdint>
#include <string>

namespace rompatch {

// Diff tuning as stored in JSON config files.
//
// Field names are snake_case:
//   search_window, max_chain_steps, min_copy_length, min_run_length,
//   min_rle_length
//
// Loading uses merge semantics: missing keys leave the existing value alone,
// so a config file only needs the knobs it changes.
struct DiffConfig {
  DiffOptions diff{};

  // IPS encoder only.
  std::uint64_t minRleLength = 4;
};

std::string DiffConfigToJson(const DiffConfig& cfg, int indentSpaces = 2);

// Apply overrides from a parsed JSON object. Wrong types, negative or
// fractional numbers and out-of-range values are InvalidArgument.
bool ApplyDiffConfigJson(const JsonValue& root, DiffConfig& ioCfg, PatchError& outError);

bool LoadDiffConfigJsonFile(const std::string& path, DiffConfig& ioCfg, PatchError& outError);

bool WriteDiffConfigJsonFile(const std::string& path, const DiffConfig& cfg, PatchError& outError,
                             int indentSpaces = 2);

} // namespace rompatch
