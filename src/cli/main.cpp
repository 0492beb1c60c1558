#include "cli/CliMain.hpp"
#include "cli/CliParse.hpp"

#include "rompatch/Checksum.hpp"
#include "rompatch/DiffConfigIO.hpp"
#include "rompatch/FileIO.hpp"
#include "rompatch/LogTee.hpp"
#include "rompatch/PatchApplier.hpp"
#include "rompatch/PatchError.hpp"
#include "rompatch/PatchInspector.hpp"
#include "rompatch/Version.hpp"

#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

using namespace rompatch;

// Exit code for `verify` (and `create --validate`) when the patch applies but
// produces different bytes.
constexpr int kExitVerifyMismatch = 7;
constexpr int kExitUsage = 1;

void PrintHelp()
{
  std::cout
      << "rompatch (binary ROM patch tool, IPS and BPS)\n\n"
      << "Usage:\n"
      << "  rompatch create  <original> <modified> <patch> [options]\n"
      << "  rompatch apply   <original> <patch>    <output> [options]\n"
      << "  rompatch inspect <patch> [options]\n"
      << "  rompatch verify  <original> <patch>    <modified>\n\n"
      << "Create options:\n"
      << "  --format <ips|bps>       Patch format (default: ips). Also --format=bps.\n"
      << "                           Aliases: simple (ips), delta (bps).\n"
      << "  --metadata <text>        BPS only: embed metadata text in the patch header.\n"
      << "  --metadata-file <path>   BPS only: embed the contents of a file as metadata.\n"
      << "  --config <json>          Load diff tuning from a JSON file (merge semantics).\n"
      << "  --window <N>             Match search window in bytes.\n"
      << "  --min-match <N>          Minimum copy length worth encoding.\n"
      << "  --validate               Re-apply the new patch and compare before writing it.\n"
      << "  --dump-config <path>     Write the effective diff configuration as JSON.\n"
      << "  --quiet                  Suppress stdout summary (errors still print).\n\n"
      << "Apply options:\n"
      << "  --no-truncate            Ignore an IPS truncation record.\n"
      << "  --quiet                  Suppress stdout summary (errors still print).\n\n"
      << "Inspect options:\n"
      << "  --json <path|->          Write a JSON report to a file, or to stdout with '-'.\n"
      << "  --records <N>            Number of IPS records to list (default: 20).\n\n"
      << "Global options:\n"
      << "  --log <file>             Also write stdout/stderr to a timestamped log file.\n"
      << "  --log-keep <N>           Rotated log files to keep (default: 3).\n"
      << "  --version                Print version and exit.\n"
      << "  -h, --help               Show this help.\n\n"
      << "Exit codes:\n"
      << "  0 ok, 1 invalid argument, 2 I/O error, 3 format error, 4 capacity exceeded,\n"
      << "  5 source mismatch, 6 corrupt patch, 7 verify mismatch\n";
}

int ReportError(const char* what, const PatchError& err)
{
  std::cerr << what << " failed: " << DescribePatchError(err) << "\n";
  return PatchErrorExitCode(err.kind);
}

int UsageError(const std::string& msg)
{
  std::cerr << msg << "\n";
  std::cerr << "Run 'rompatch --help' for usage.\n";
  return kExitUsage;
}

// Option walker shared by the subcommands. Accepts both "--key value" and
// "--key=value" for options that take a value.
struct ArgCursor {
  int argc = 0;
  char** argv = nullptr;
  int i = 0;

  std::string key;
  std::string inlineValue;
  bool hasInlineValue = false;

  bool next()
  {
    if (i >= argc) return false;
    cli::SplitLongOption(argv[i], &key, &inlineValue, &hasInlineValue);
    ++i;
    return true;
  }

  bool value(std::string& out)
  {
    if (hasInlineValue) {
      out = inlineValue;
      return true;
    }
    if (i >= argc) return false;
    out = argv[i++];
    return true;
  }
};

int RunCreate(const std::vector<std::string>& pos, ArgCursor& args)
{
  bool quiet = false;
  bool validate = false;
  std::string formatName = "ips";
  std::string metadataText;
  std::string metadataFile;
  std::string configPath;
  std::string dumpConfigPath;
  std::string windowArg;
  std::string minMatchArg;
  bool hasMetadataText = false;

  while (args.next()) {
    const std::string& a = args.key;
    if (a == "--quiet") {
      quiet = true;
    } else if (a == "--validate") {
      validate = true;
    } else if (a == "--format") {
      if (!args.value(formatName)) return UsageError("--format requires a value");
    } else if (a == "--metadata") {
      if (!args.value(metadataText)) return UsageError("--metadata requires a value");
      hasMetadataText = true;
    } else if (a == "--metadata-file") {
      if (!args.value(metadataFile)) return UsageError("--metadata-file requires a path");
    } else if (a == "--config") {
      if (!args.value(configPath)) return UsageError("--config requires a path");
    } else if (a == "--dump-config") {
      if (!args.value(dumpConfigPath)) return UsageError("--dump-config requires a path");
    } else if (a == "--window") {
      if (!args.value(windowArg)) return UsageError("--window requires a value");
    } else if (a == "--min-match") {
      if (!args.value(minMatchArg)) return UsageError("--min-match requires a value");
    } else {
      return UsageError("Unknown option for create: " + a);
    }
  }

  if (pos.size() != 3) return UsageError("create expects <original> <modified> <patch>");
  if (hasMetadataText && !metadataFile.empty()) {
    return UsageError("--metadata and --metadata-file are mutually exclusive");
  }

  PatchCreateOptions opt;
  if (!ParsePatchFormat(formatName, opt.format)) return UsageError("Unknown patch format: " + formatName);

  // Defaults, then the config file, then explicit flags.
  DiffConfig cfg;
  PatchError err;
  if (!configPath.empty() && !LoadDiffConfigJsonFile(configPath, cfg, err)) return ReportError("config", err);

  if (!windowArg.empty() && !cli::ParsePositiveU64(windowArg, &cfg.diff.searchWindow)) {
    return UsageError("--window expects a positive integer, got: " + windowArg);
  }
  if (!minMatchArg.empty() && !cli::ParsePositiveU64(minMatchArg, &cfg.diff.minCopyLength)) {
    return UsageError("--min-match expects a positive integer, got: " + minMatchArg);
  }
  if (!ValidateDiffOptions(cfg.diff, err)) return ReportError("create", err);

  if (!dumpConfigPath.empty()) {
    if (!cli::EnsureParentDir(dumpConfigPath) || !WriteDiffConfigJsonFile(dumpConfigPath, cfg, err)) {
      if (err.ok()) Fail(err, PatchErrorKind::IoError, "cannot create directory for " + dumpConfigPath);
      return ReportError("dump-config", err);
    }
  }

  opt.diff = cfg.diff;
  opt.minRleLength = cfg.minRleLength;
  if (hasMetadataText) {
    opt.metadata.assign(metadataText.begin(), metadataText.end());
  } else if (!metadataFile.empty()) {
    if (!ReadFileBytes(metadataFile, opt.metadata, err)) return ReportError("read metadata", err);
  }

  std::vector<std::uint8_t> source;
  std::vector<std::uint8_t> target;
  if (!ReadFileBytes(pos[0], source, err)) return ReportError("read original", err);
  if (!ReadFileBytes(pos[1], target, err)) return ReportError("read modified", err);

  std::vector<std::uint8_t> patch;
  if (!CreatePatch(source, target, opt, patch, err)) return ReportError("create", err);

  if (validate) {
    bool matches = false;
    std::uint64_t firstDiff = 0;
    if (!VerifyPatch(source, patch, target, matches, firstDiff, err)) return ReportError("validate", err);
    if (!matches) {
      std::cerr << "validate failed: patch output differs from " << pos[1] << " at offset " << firstDiff << "\n";
      return kExitVerifyMismatch;
    }
  }

  if (!cli::EnsureParentDir(pos[2])) {
    Fail(err, PatchErrorKind::IoError, "cannot create directory for " + pos[2]);
    return ReportError("write patch", err);
  }
  if (!WriteFileBytesAtomic(pos[2], patch, err)) return ReportError("write patch", err);

  if (!quiet) {
    std::cout << "Patch written: " << pos[2] << "\n";
    std::cout << "  format:      " << PatchFormatName(opt.format) << "\n";
    std::cout << "  patch size:  " << patch.size() << " bytes\n";
    std::cout << "  source:      " << source.size() << " bytes, crc32 " << cli::HexU32(Crc32(source)) << "\n";
    std::cout << "  target:      " << target.size() << " bytes, crc32 " << cli::HexU32(Crc32(target)) << "\n";
    if (!opt.metadata.empty()) std::cout << "  metadata:    " << opt.metadata.size() << " bytes\n";
    if (validate) std::cout << "  validated:   yes\n";
  }
  return 0;
}

int RunApply(const std::vector<std::string>& pos, ArgCursor& args)
{
  bool quiet = false;
  ApplyOptions opt;

  while (args.next()) {
    const std::string& a = args.key;
    if (a == "--quiet") {
      quiet = true;
    } else if (a == "--no-truncate") {
      opt.honorTruncation = false;
    } else {
      return UsageError("Unknown option for apply: " + a);
    }
  }
  if (pos.size() != 3) return UsageError("apply expects <original> <patch> <output>");

  PatchError err;
  std::vector<std::uint8_t> source;
  std::vector<std::uint8_t> patch;
  if (!ReadFileBytes(pos[0], source, err)) return ReportError("read original", err);
  if (!ReadFileBytes(pos[1], patch, err)) return ReportError("read patch", err);

  const PatchFormat format = DetectPatchFormat(patch);
  std::vector<std::uint8_t> out;
  if (!ApplyPatch(source, patch, opt, out, err)) return ReportError("apply", err);

  if (!cli::EnsureParentDir(pos[2])) {
    Fail(err, PatchErrorKind::IoError, "cannot create directory for " + pos[2]);
    return ReportError("write output", err);
  }
  if (!WriteFileBytesAtomic(pos[2], out, err)) return ReportError("write output", err);

  if (!quiet) {
    std::cout << "Patched file written: " << pos[2] << "\n";
    std::cout << "  format:      " << PatchFormatName(format) << "\n";
    std::cout << "  output size: " << out.size() << " bytes\n";
    std::cout << "  crc32:       " << cli::HexU32(Crc32(out)) << "\n";
  }
  return 0;
}

int RunInspect(const std::vector<std::string>& pos, ArgCursor& args)
{
  std::string jsonPath;
  int maxRecords = 20;

  while (args.next()) {
    const std::string& a = args.key;
    if (a == "--json") {
      if (!args.value(jsonPath)) return UsageError("--json requires a path (or '-')");
    } else if (a == "--records") {
      std::string v;
      if (!args.value(v) || !cli::ParseI32(v, &maxRecords) || maxRecords < 0) {
        return UsageError("--records expects a non-negative integer");
      }
    } else {
      return UsageError("Unknown option for inspect: " + a);
    }
  }
  if (pos.size() != 1) return UsageError("inspect expects <patch>");

  PatchError err;
  std::vector<std::uint8_t> patch;
  if (!ReadFileBytes(pos[0], patch, err)) return ReportError("read patch", err);

  PatchInfo info;
  if (!InspectPatch(patch, info, err, static_cast<std::size_t>(maxRecords))) return ReportError("inspect", err);

  if (jsonPath == "-") {
    std::string jsonErr;
    if (!WritePatchInfoJson(std::cout, info, jsonErr)) {
      Fail(err, PatchErrorKind::IoError, jsonErr);
      return ReportError("inspect", err);
    }
    return 0;
  }

  std::cout << FormatPatchInfo(info, static_cast<std::size_t>(maxRecords));

  if (!jsonPath.empty()) {
    std::ostringstream oss;
    std::string jsonErr;
    if (!WritePatchInfoJson(oss, info, jsonErr)) {
      Fail(err, PatchErrorKind::IoError, jsonErr);
      return ReportError("inspect", err);
    }
    if (!cli::EnsureParentDir(jsonPath) || !WriteFileTextAtomic(jsonPath, oss.str(), err)) {
      if (err.ok()) Fail(err, PatchErrorKind::IoError, "cannot create directory for " + jsonPath);
      return ReportError("write json", err);
    }
    std::cout << "JSON report written: " << jsonPath << "\n";
  }
  return 0;
}

int RunVerify(const std::vector<std::string>& pos, ArgCursor& args)
{
  if (args.next()) return UsageError("Unknown option for verify: " + args.key);
  if (pos.size() != 3) return UsageError("verify expects <original> <patch> <modified>");

  PatchError err;
  std::vector<std::uint8_t> source;
  std::vector<std::uint8_t> patch;
  std::vector<std::uint8_t> expected;
  if (!ReadFileBytes(pos[0], source, err)) return ReportError("read original", err);
  if (!ReadFileBytes(pos[1], patch, err)) return ReportError("read patch", err);
  if (!ReadFileBytes(pos[2], expected, err)) return ReportError("read modified", err);

  bool matches = false;
  std::uint64_t firstDiff = 0;
  if (!VerifyPatch(source, patch, expected, matches, firstDiff, err)) return ReportError("verify", err);

  if (!matches) {
    std::cerr << "verify failed: output differs from " << pos[2] << " at offset " << firstDiff << "\n";
    return kExitVerifyMismatch;
  }

  std::cout << "OK: " << pos[1] << " turns " << pos[0] << " into " << pos[2] << " (" << expected.size()
            << " bytes, crc32 " << cli::HexU32(Crc32(expected)) << ")\n";
  return 0;
}

} // namespace

namespace rompatch {

int RomPatchCliMain(int argc, char** argv)
{
  // Pull out global options first; they may appear anywhere on the line.
  std::vector<char*> rest;
  std::string logPath;
  int logKeep = 3;
  for (int i = 1; i < argc; ++i) {
    std::string key;
    std::string value;
    bool hasValue = false;
    cli::SplitLongOption(argv[i], &key, &value, &hasValue);

    if (key == "--log" || key == "--log-keep") {
      if (!hasValue) {
        if (i + 1 >= argc) return UsageError(key + " requires a value");
        value = argv[++i];
      }
      if (key == "--log") {
        logPath = value;
      } else if (!cli::ParseI32(value, &logKeep) || logKeep < 0) {
        return UsageError("--log-keep expects a non-negative integer");
      }
      continue;
    }
    rest.push_back(argv[i]);
  }

  LogTee tee;
  if (!logPath.empty()) {
    LogTeeOptions lopt;
    lopt.path = logPath;
    lopt.keepFiles = logKeep;
    std::string logErr;
    if (!tee.start(lopt, logErr)) {
      std::cerr << "log: " << logErr << "\n";
      return PatchErrorExitCode(PatchErrorKind::IoError);
    }
  }

  if (rest.empty()) {
    PrintHelp();
    return kExitUsage;
  }

  const std::string mode = rest[0];
  if (mode == "-h" || mode == "--help" || mode == "help") {
    PrintHelp();
    return 0;
  }
  if (mode == "--version") {
    std::cout << "rompatch " << RomPatchFullVersionString() << "\n";
    return 0;
  }

  // Positional arguments first, options after; "-" alone is positional.
  std::vector<std::string> pos;
  std::size_t k = 1;
  for (; k < rest.size() && !cli::IsOption(rest[k]); ++k) pos.push_back(rest[k]);

  for (std::size_t j = k; j < rest.size(); ++j) {
    const std::string a = rest[j];
    if (a == "-h" || a == "--help") {
      PrintHelp();
      return 0;
    }
  }

  ArgCursor args;
  args.argc = static_cast<int>(rest.size());
  args.argv = rest.data();
  args.i = static_cast<int>(k);

  if (mode == "create") return RunCreate(pos, args);
  if (mode == "apply") return RunApply(pos, args);
  if (mode == "inspect") return RunInspect(pos, args);
  if (mode == "verify") return RunVerify(pos, args);

  return UsageError("Unknown command: " + mode);
}

} // namespace rompatch
