#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace rompatch {

// RAII helper that duplicates std::cout/std::cerr into a log file.
//
// The console output is unchanged. In the file, each line is prefixed with a
// UTC timestamp and the stream it came from:
//
//   2026-01-27T16:40:12.345Z [OUT] Patch written: hack.ips
//   2026-01-27T16:40:12.346Z [ERR] apply failed: source_mismatch: ...
//
// Existing logs are rotated on start: <log> -> <log>.1 -> <log>.2 ... up to
// keepFiles.

struct LogTeeOptions {
  std::filesystem::path path;

  // Number of rotated backups to keep. 0 truncates the existing file.
  int keepFiles = 3;

  bool teeStdout = true;
  bool teeStderr = true;

  bool prefixLines = true;
};

class LogTee {
public:
  LogTee();
  ~LogTee();

  LogTee(const LogTee&) = delete;
  LogTee& operator=(const LogTee&) = delete;

  // Start logging. An active tee is stopped first.
  bool start(const LogTeeOptions& opt, std::string& outError);

  // Restore the original std::cout/std::cerr buffers and close the file.
  void stop();

  bool active() const;
  const std::filesystem::path& path() const;

  static bool Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError);

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace rompatch
