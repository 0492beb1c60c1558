#include "rompatch/FileIO.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>

#if !defined(_WIN32)
  #include <fcntl.h>
  #include <unistd.h>
#endif

namespace rompatch {

namespace {

// Flush file contents to stable storage. Not every platform/filesystem
// supports this, so failures are ignored.
void BestEffortSyncFile(const std::filesystem::path& path)
{
#if !defined(_WIN32)
  const int fd = ::open(path.c_str(), O_RDONLY);
  if (fd < 0) return;
  (void)::fsync(fd);
  ::close(fd);
#else
  (void)path;
#endif
}

void BestEffortSyncDirectory(const std::filesystem::path& dir)
{
#if !defined(_WIN32)
  int flags = O_RDONLY;
#ifdef O_DIRECTORY
  flags |= O_DIRECTORY;
#endif
  const int fd = ::open(dir.c_str(), flags);
  if (fd < 0) return;
  (void)::fsync(fd);
  ::close(fd);
#else
  (void)dir;
#endif
}

bool WriteAtomic(const std::filesystem::path& path, const char* data, std::size_t size, PatchError& outError)
{
  namespace fs = std::filesystem;
  outError.clear();

  if (path.empty()) {
    return Fail(outError, PatchErrorKind::InvalidArgument, "output path is empty");
  }

  const fs::path tmpPath = fs::path(path.string() + ".tmp");
  const fs::path dir = path.parent_path().empty() ? fs::path(".") : path.parent_path();

  {
    std::ofstream f(tmpPath, std::ios::binary | std::ios::trunc);
    if (!f) {
      return Fail(outError, PatchErrorKind::IoError,
                  "failed to open for writing: " + tmpPath.string() + ": " + std::strerror(errno));
    }
    if (size > 0) f.write(data, static_cast<std::streamsize>(size));
    f.flush();
    if (!f) {
      f.close();
      std::error_code ec;
      fs::remove(tmpPath, ec);
      return Fail(outError, PatchErrorKind::IoError, "failed to write file: " + tmpPath.string());
    }
  }

  BestEffortSyncFile(tmpPath);

  std::error_code ec;
  fs::rename(tmpPath, path, ec);
  if (ec) {
    std::error_code ec2;
    fs::remove(tmpPath, ec2);
    return Fail(outError, PatchErrorKind::IoError,
                "failed to replace '" + path.string() + "': " + ec.message());
  }

  BestEffortSyncDirectory(dir);
  return true;
}

} // namespace

bool ReadFileBytes(const std::filesystem::path& path, std::vector<std::uint8_t>& outBytes, PatchError& outError)
{
  outError.clear();
  outBytes.clear();

  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    return Fail(outError, PatchErrorKind::IoError, "is a directory: " + path.string());
  }

  std::ifstream f(path, std::ios::binary);
  if (!f) {
    return Fail(outError, PatchErrorKind::IoError,
                "failed to open for reading: " + path.string() + ": " + std::strerror(errno));
  }

  std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  if (f.bad()) {
    return Fail(outError, PatchErrorKind::IoError, "failed to read file: " + path.string());
  }

  outBytes = std::move(bytes);
  return true;
}

bool ReadFileText(const std::filesystem::path& path, std::string& outText, PatchError& outError)
{
  outText.clear();
  std::vector<std::uint8_t> bytes;
  if (!ReadFileBytes(path, bytes, outError)) return false;
  outText.assign(bytes.begin(), bytes.end());
  return true;
}

bool WriteFileBytesAtomic(const std::filesystem::path& path, const std::vector<std::uint8_t>& bytes,
                          PatchError& outError)
{
  return WriteAtomic(path, reinterpret_cast<const char*>(bytes.data()), bytes.size(), outError);
}

bool WriteFileTextAtomic(const std::filesystem::path& path, const std::string& text, PatchError& outError)
{
  return WriteAtomic(path, text.data(), text.size(), outError);
}

} // namespace rompatch
