#include "rompatch/PatchError.hpp"

namespace rompatch {

const char* PatchErrorKindName(PatchErrorKind kind)
{
  switch (kind) {
  case PatchErrorKind::None: return "ok";
  case PatchErrorKind::FormatError: return "format_error";
  case PatchErrorKind::CapacityExceeded: return "capacity_exceeded";
  case PatchErrorKind::SourceMismatch: return "source_mismatch";
  case PatchErrorKind::CorruptPatch: return "corrupt_patch";
  case PatchErrorKind::IoError: return "io_error";
  case PatchErrorKind::InvalidArgument: return "invalid_argument";
  }
  return "unknown";
}

int PatchErrorExitCode(PatchErrorKind kind)
{
  switch (kind) {
  case PatchErrorKind::None: return 0;
  case PatchErrorKind::InvalidArgument: return 1;
  case PatchErrorKind::IoError: return 2;
  case PatchErrorKind::FormatError: return 3;
  case PatchErrorKind::CapacityExceeded: return 4;
  case PatchErrorKind::SourceMismatch: return 5;
  case PatchErrorKind::CorruptPatch: return 6;
  }
  return 1;
}

std::string DescribePatchError(const PatchError& err)
{
  std::string s = PatchErrorKindName(err.kind);
  if (!err.message.empty()) {
    s += ": ";
    s += err.message;
  }
  return s;
}

} // namespace rompatch
