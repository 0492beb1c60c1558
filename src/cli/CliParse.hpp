#pragma once

// Small argument parsing helpers for the rompatch CLI.
//
// Kept header-only so the parse tests can include them without linking the
// CLI itself.

#include <charconv>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace rompatch::cli {

inline bool EnsureParentDir(const std::filesystem::path& file)
{
  if (file.empty()) return false;
  std::error_code ec;
  const std::filesystem::path parent = file.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) return false;
  }
  return true;
}

inline bool ParseI32(std::string_view s, int* out)
{
  if (!out) return false;
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return false;

  int v = 0;
  const char* begin = s.data();
  const char* end = s.data() + s.size();
  const auto res = std::from_chars(begin, end, v, 10);
  if (res.ec != std::errc() || res.ptr != end) return false;
  *out = v;
  return true;
}

// Decimal, or hex with a 0x prefix.
inline bool ParseU64(std::string_view s, std::uint64_t* out)
{
  if (!out) return false;
  if (s.empty()) return false;

  int base = 10;
  if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
    base = 16;
    s.remove_prefix(2);
  }
  if (s.empty()) return false;

  std::uint64_t v = 0;
  const char* begin = s.data();
  const char* end = s.data() + s.size();
  const auto res = std::from_chars(begin, end, v, base);
  if (res.ec != std::errc() || res.ptr != end) return false;
  *out = v;
  return true;
}

// Like ParseU64 but also rejects zero.
inline bool ParsePositiveU64(std::string_view s, std::uint64_t* out)
{
  std::uint64_t v = 0;
  if (!ParseU64(s, &v) || v == 0) return false;
  if (out) *out = v;
  return out != nullptr;
}

// Split "--key=value" into ("--key", "value"). Arguments without '=' are
// returned unchanged with an empty value and hasValue == false.
inline void SplitLongOption(std::string_view arg, std::string* outKey, std::string* outValue, bool* outHasValue)
{
  const std::size_t eq = (arg.size() > 2 && arg.substr(0, 2) == "--") ? arg.find('=') : std::string_view::npos;
  if (eq == std::string_view::npos) {
    if (outKey) *outKey = std::string(arg);
    if (outValue) outValue->clear();
    if (outHasValue) *outHasValue = false;
    return;
  }
  if (outKey) *outKey = std::string(arg.substr(0, eq));
  if (outValue) *outValue = std::string(arg.substr(eq + 1));
  if (outHasValue) *outHasValue = true;
}

inline std::string HexU32(std::uint32_t v)
{
  std::ostringstream oss;
  oss << "0x" << std::hex << std::uppercase << std::setw(8) << std::setfill('0') << v;
  return oss.str();
}

inline bool IsOption(std::string_view a)
{
  return a.size() > 1 && a[0] == '-';
}

} // namespace rompatch::cli
