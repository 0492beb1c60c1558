#pragma once

#include <string>

// Build/version metadata for rompatch.
//
// CMake defines these macros for every target through rompatch_core's PUBLIC
// compile definitions. The fallbacks keep the header usable in IDEs and
// non-CMake builds.

#ifndef ROMPATCH_VERSION_MAJOR
#define ROMPATCH_VERSION_MAJOR 0
#endif

#ifndef ROMPATCH_VERSION_MINOR
#define ROMPATCH_VERSION_MINOR 0
#endif

#ifndef ROMPATCH_VERSION_PATCH
#define ROMPATCH_VERSION_PATCH 0
#endif

#ifndef ROMPATCH_VERSION_STRING
#define ROMPATCH_VERSION_STRING "0.0.0"
#endif

#ifndef ROMPATCH_GIT_SHA
#define ROMPATCH_GIT_SHA "unknown"
#endif

namespace rompatch {

inline constexpr const char* RomPatchVersionString()
{
  return ROMPATCH_VERSION_STRING;
}

inline constexpr const char* RomPatchGitSha()
{
  return ROMPATCH_GIT_SHA;
}

// "1.2.3" or "1.2.3 (abc1234)" when the build knows its commit.
inline std::string RomPatchFullVersionString()
{
  std::string s = RomPatchVersionString();
  const std::string sha = RomPatchGitSha();
  if (!sha.empty() && sha != "unknown") {
    s += " (";
    s += sha;
    s += ")";
  }
  return s;
}

} // namespace rompatch
