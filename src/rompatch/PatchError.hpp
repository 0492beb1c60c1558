#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace rompatch {

// Error taxonomy shared by every fallible rompatch operation.
//
// Functions return bool and fill a PatchError out-parameter. Output buffers are
// always cleared on failure, so a caller can never pick up a half-built target.
enum class PatchErrorKind : std::uint8_t {
  None = 0,

  // Bad magic, truncated header/record, malformed varint, trailing garbage.
  FormatError,

  // IPS offset/length/truncation does not fit its fixed-width field.
  CapacityExceeded,

  // BPS source size or CRC does not match the buffer being patched.
  SourceMismatch,

  // BPS patch CRC mismatch, out-of-range replay, or target CRC mismatch.
  CorruptPatch,

  // File could not be opened, read, or written.
  IoError,

  // Bad CLI argument or configuration value.
  InvalidArgument,
};

struct PatchError {
  PatchErrorKind kind = PatchErrorKind::None;
  std::string message;

  bool ok() const { return kind == PatchErrorKind::None; }

  void clear()
  {
    kind = PatchErrorKind::None;
    message.clear();
  }
};

// Convenience for the common "set and return false" pattern.
inline bool Fail(PatchError& outError, PatchErrorKind kind, std::string message)
{
  outError.kind = kind;
  outError.message = std::move(message);
  return false;
}

// Stable identifier, e.g. "format_error". Used in CLI messages and JSON output.
const char* PatchErrorKindName(PatchErrorKind kind);

// Process exit code for the CLI. Each kind maps to a distinct non-zero value.
int PatchErrorExitCode(PatchErrorKind kind);

// "<kind name>: <message>"
std::string DescribePatchError(const PatchError& err);

} // namespace rompatch
