#pragma once

#include "rompatch/PatchError.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace rompatch {

// Whole-file helpers for the CLI. Failures are reported as IoError.

bool ReadFileBytes(const std::filesystem::path& path, std::vector<std::uint8_t>& outBytes, PatchError& outError);

bool ReadFileText(const std::filesystem::path& path, std::string& outText, PatchError& outError);

// Write to "<path>.tmp", fsync it (best-effort), then rename over `path`.
// A reader never observes a partially written file; the temp file is removed
// on failure.
bool WriteFileBytesAtomic(const std::filesystem::path& path, const std::vector<std::uint8_t>& bytes,
                          PatchError& outError);

bool WriteFileTextAtomic(const std::filesystem::path& path, const std::string& text, PatchError& outError);

} // namespace rompatch
