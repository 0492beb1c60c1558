#include "cli/CliMain.hpp"

#include "rompatch/Checksum.hpp"
#include "rompatch/FileIO.hpp"
#include "rompatch/Json.hpp"
#include "rompatch/PatchError.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                    \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";   \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                    \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

using Bytes = std::vector<std::uint8_t>;

static fs::path MakeTempPath(const std::string& prefix)
{
  static std::uint64_t counter = 0;
  ++counter;

  std::error_code ec;
  fs::path root = fs::temp_directory_path(ec);
  if (ec || root.empty()) {
    root = fs::current_path(ec);
    if (ec || root.empty()) {
      root = fs::path(".");
    }
  }

  const auto stamp = static_cast<std::uint64_t>(
    std::chrono::high_resolution_clock::now().time_since_epoch().count());

  return root / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter));
}

static int RunCli(const std::vector<std::string>& args)
{
  std::vector<std::string> storage;
  storage.reserve(args.size() + 1);
  storage.push_back("rompatch");
  for (const std::string& a : args) storage.push_back(a);

  std::vector<char*> argv;
  argv.reserve(storage.size() + 1);
  for (std::string& s : storage) argv.push_back(s.data());
  argv.push_back(nullptr);

  return rompatch::RomPatchCliMain(static_cast<int>(storage.size()), argv.data());
}

static bool WriteBytes(const fs::path& p, const Bytes& bytes)
{
  rompatch::PatchError err;
  return rompatch::WriteFileBytesAtomic(p, bytes, err);
}

static Bytes ReadBytes(const fs::path& p)
{
  Bytes out;
  rompatch::PatchError err;
  if (!rompatch::ReadFileBytes(p, out, err)) out.clear();
  return out;
}

// A small "ROM" and an edited copy: a changed header byte, a filled region,
// a relocated block and some growth.
struct RomPair {
  Bytes original;
  Bytes modified;
};

static RomPair MakeRomPair()
{
  RomPair p;
  p.original.resize(8192);
  std::uint32_t s = 0x12345678u;
  for (std::uint8_t& b : p.original) {
    s = s * 1664525u + 1013904223u;
    b = static_cast<std::uint8_t>(s >> 24);
  }

  p.modified = p.original;
  p.modified[0x10] = 0x42;
  for (std::size_t i = 0x400; i < 0x480; ++i) p.modified[i] = 0xFF;
  for (std::size_t i = 0; i < 256; ++i) p.modified[0x1000 + i] = p.original[0x1800 + i];
  for (int i = 0; i < 300; ++i) p.modified.push_back(static_cast<std::uint8_t>(i * 7));
  return p;
}

static void TestUsage()
{
  EXPECT_EQ(RunCli({}), 1);
  EXPECT_EQ(RunCli({"--help"}), 0);
  EXPECT_EQ(RunCli({"create", "--help"}), 0);
  EXPECT_EQ(RunCli({"--version"}), 0);
  EXPECT_EQ(RunCli({"frobnicate"}), 1);
  EXPECT_EQ(RunCli({"create", "a", "b"}), 1);
  EXPECT_EQ(RunCli({"apply", "a", "b", "c", "--bogus"}), 1);
  EXPECT_EQ(RunCli({"inspect", "p", "--records", "-4"}), 1);
  EXPECT_EQ(RunCli({"create", "a", "b", "c", "--format", "ups"}), 1);
  EXPECT_EQ(RunCli({"create", "a", "b", "c", "--window", "0"}), 1);
  EXPECT_EQ(RunCli({"--log-keep", "x", "inspect", "p"}), 1);
}

static void TestIpsCreateApplyVerify()
{
  std::error_code ec;
  const fs::path dir = MakeTempPath("rompatch_cli_ips");
  fs::create_directories(dir, ec);

  const RomPair rom = MakeRomPair();
  const fs::path orig = dir / "game.sfc";
  const fs::path mod = dir / "game_hack.sfc";
  ASSERT_TRUE(WriteBytes(orig, rom.original));
  ASSERT_TRUE(WriteBytes(mod, rom.modified));

  // Output directories are created on demand.
  const fs::path patch = dir / "out" / "hack.ips";
  EXPECT_EQ(RunCli({"create", orig.string(), mod.string(), patch.string(), "--quiet"}), 0);
  const Bytes patchBytes = ReadBytes(patch);
  ASSERT_TRUE(patchBytes.size() > 8);
  EXPECT_TRUE(std::string(patchBytes.begin(), patchBytes.begin() + 5) == "PATCH");

  const fs::path out = dir / "patched.sfc";
  EXPECT_EQ(RunCli({"apply", orig.string(), patch.string(), out.string(), "--quiet"}), 0);
  EXPECT_TRUE(ReadBytes(out) == rom.modified);

  EXPECT_EQ(RunCli({"verify", orig.string(), patch.string(), mod.string()}), 0);

  // Expected file that differs from the patch output.
  Bytes other = rom.modified;
  other[0x2000] ^= 0x01u;
  const fs::path otherPath = dir / "other.sfc";
  ASSERT_TRUE(WriteBytes(otherPath, other));
  EXPECT_EQ(RunCli({"verify", orig.string(), patch.string(), otherPath.string()}), 7);

  // Metadata is a BPS feature.
  EXPECT_EQ(RunCli({"create", orig.string(), mod.string(), (dir / "meta.ips").string(), "--metadata", "x"}), 1);
  EXPECT_FALSE(fs::exists(dir / "meta.ips"));

  fs::remove_all(dir, ec);
}

static void TestIpsTruncationFlag()
{
  std::error_code ec;
  const fs::path dir = MakeTempPath("rompatch_cli_trunc");
  fs::create_directories(dir, ec);

  const RomPair rom = MakeRomPair();
  const Bytes shorter(rom.original.begin(), rom.original.begin() + 4096);
  const fs::path orig = dir / "a.bin";
  const fs::path mod = dir / "b.bin";
  ASSERT_TRUE(WriteBytes(orig, rom.original));
  ASSERT_TRUE(WriteBytes(mod, shorter));

  const fs::path patch = dir / "cut.ips";
  EXPECT_EQ(RunCli({"create", orig.string(), mod.string(), patch.string(), "--quiet"}), 0);

  const fs::path out = dir / "out.bin";
  EXPECT_EQ(RunCli({"apply", orig.string(), patch.string(), out.string(), "--quiet"}), 0);
  EXPECT_TRUE(ReadBytes(out) == shorter);

  EXPECT_EQ(RunCli({"apply", orig.string(), patch.string(), out.string(), "--quiet", "--no-truncate"}), 0);
  EXPECT_TRUE(ReadBytes(out) == rom.original);

  fs::remove_all(dir, ec);
}

static void TestBpsWorkflow()
{
  std::error_code ec;
  const fs::path dir = MakeTempPath("rompatch_cli_bps");
  fs::create_directories(dir, ec);

  const RomPair rom = MakeRomPair();
  const fs::path orig = dir / "game.gba";
  const fs::path mod = dir / "game_hack.gba";
  ASSERT_TRUE(WriteBytes(orig, rom.original));
  ASSERT_TRUE(WriteBytes(mod, rom.modified));

  const fs::path patch = dir / "hack.bps";
  const fs::path dump = dir / "cfg" / "effective.json";
  EXPECT_EQ(RunCli({"create", orig.string(), mod.string(), patch.string(), "--format=bps", "--metadata",
                    "title=Hack", "--validate", "--window", "0x10000", "--dump-config", dump.string()}),
            0);
  const Bytes patchBytes = ReadBytes(patch);
  ASSERT_TRUE(patchBytes.size() > 19);
  EXPECT_TRUE(std::string(patchBytes.begin(), patchBytes.begin() + 4) == "BPS1");

  // The dumped config reflects the --window override.
  {
    std::string text;
    rompatch::PatchError err;
    ASSERT_TRUE(rompatch::ReadFileText(dump, text, err));
    rompatch::JsonValue root;
    std::string jerr;
    ASSERT_TRUE(rompatch::ParseJson(text, root, jerr));
    const rompatch::JsonValue* w = rompatch::FindJsonMember(root, "search_window");
    ASSERT_TRUE(w && w->isNumber());
    EXPECT_EQ(w->numberValue, 65536.0);
  }

  const fs::path out = dir / "patched.gba";
  EXPECT_EQ(RunCli({"apply", orig.string(), patch.string(), out.string(), "--quiet"}), 0);
  EXPECT_TRUE(ReadBytes(out) == rom.modified);

  const fs::path json = dir / "report" / "info.json";
  EXPECT_EQ(RunCli({"inspect", patch.string(), "--json", json.string()}), 0);
  {
    std::string text;
    rompatch::PatchError err;
    ASSERT_TRUE(rompatch::ReadFileText(json, text, err));
    rompatch::JsonValue root;
    std::string jerr;
    ASSERT_TRUE(rompatch::ParseJson(text, root, jerr));
    const rompatch::JsonValue* format = rompatch::FindJsonMember(root, "format");
    ASSERT_TRUE(format && format->isString());
    EXPECT_EQ(format->stringValue, std::string("bps"));
    const rompatch::JsonValue* meta = rompatch::FindJsonMember(root, "metadata_preview");
    ASSERT_TRUE(meta && meta->isString());
    EXPECT_EQ(meta->stringValue, std::string("title=Hack"));
    const rompatch::JsonValue* target = rompatch::FindJsonMember(root, "target_size");
    ASSERT_TRUE(target && target->isNumber());
    EXPECT_EQ(target->numberValue, static_cast<double>(rom.modified.size()));
  }

  // Wrong base ROM.
  Bytes wrongBase = rom.original;
  wrongBase[100] ^= 0x20u;
  const fs::path wrong = dir / "wrong.gba";
  ASSERT_TRUE(WriteBytes(wrong, wrongBase));
  const fs::path out2 = dir / "never.gba";
  EXPECT_EQ(RunCli({"apply", wrong.string(), patch.string(), out2.string()}), 5);
  EXPECT_FALSE(fs::exists(out2));

  // Damaged patch.
  Bytes damaged = patchBytes;
  damaged[damaged.size() / 2] ^= 0x10u;
  const fs::path bad = dir / "bad.bps";
  ASSERT_TRUE(WriteBytes(bad, damaged));
  EXPECT_EQ(RunCli({"apply", orig.string(), bad.string(), out2.string()}), 6);
  EXPECT_FALSE(fs::exists(out2));

  fs::remove_all(dir, ec);
}

static void TestFormatAliases()
{
  std::error_code ec;
  const fs::path dir = MakeTempPath("rompatch_cli_aliases");
  fs::create_directories(dir, ec);

  const RomPair rom = MakeRomPair();
  const fs::path orig = dir / "a.bin";
  const fs::path mod = dir / "b.bin";
  ASSERT_TRUE(WriteBytes(orig, rom.original));
  ASSERT_TRUE(WriteBytes(mod, rom.modified));

  const fs::path delta = dir / "delta.patch";
  EXPECT_EQ(RunCli({"create", orig.string(), mod.string(), delta.string(), "--format=delta", "--quiet"}), 0);
  const Bytes deltaBytes = ReadBytes(delta);
  ASSERT_TRUE(deltaBytes.size() > 4);
  EXPECT_TRUE(std::string(deltaBytes.begin(), deltaBytes.begin() + 4) == "BPS1");

  const fs::path simple = dir / "simple.patch";
  EXPECT_EQ(RunCli({"create", orig.string(), mod.string(), simple.string(), "--format", "SIMPLE", "--quiet"}), 0);
  const Bytes simpleBytes = ReadBytes(simple);
  ASSERT_TRUE(simpleBytes.size() > 5);
  EXPECT_TRUE(std::string(simpleBytes.begin(), simpleBytes.begin() + 5) == "PATCH");

  // Both apply back to the modified image.
  const fs::path out = dir / "out.bin";
  EXPECT_EQ(RunCli({"apply", orig.string(), delta.string(), out.string(), "--quiet"}), 0);
  EXPECT_TRUE(ReadBytes(out) == rom.modified);

  EXPECT_EQ(RunCli({"create", orig.string(), mod.string(), (dir / "x.patch").string(), "--format=ups"}), 1);

  fs::remove_all(dir, ec);
}

static void TestConfigFile()
{
  std::error_code ec;
  const fs::path dir = MakeTempPath("rompatch_cli_config");
  fs::create_directories(dir, ec);

  const RomPair rom = MakeRomPair();
  const fs::path orig = dir / "a.bin";
  const fs::path mod = dir / "b.bin";
  ASSERT_TRUE(WriteBytes(orig, rom.original));
  ASSERT_TRUE(WriteBytes(mod, rom.modified));

  rompatch::PatchError err;
  const fs::path good = dir / "good.json";
  ASSERT_TRUE(rompatch::WriteFileTextAtomic(good, "{\"min_copy_length\": 8, \"min_rle_length\": 16}", err));
  const fs::path badCfg = dir / "bad.json";
  ASSERT_TRUE(rompatch::WriteFileTextAtomic(badCfg, "{\"min_copy_length\": -8}", err));

  const fs::path patch = dir / "p.ips";
  EXPECT_EQ(RunCli({"create", orig.string(), mod.string(), patch.string(), "--config", good.string(), "--quiet"}),
            0);
  EXPECT_EQ(RunCli({"verify", orig.string(), patch.string(), mod.string()}), 0);

  EXPECT_EQ(RunCli({"create", orig.string(), mod.string(), patch.string(), "--config", badCfg.string()}), 1);
  EXPECT_EQ(RunCli({"create", orig.string(), mod.string(), patch.string(), "--config",
                    (dir / "missing.json").string()}),
            2);

  fs::remove_all(dir, ec);
}

static void TestErrorsAndExitCodes()
{
  std::error_code ec;
  const fs::path dir = MakeTempPath("rompatch_cli_errors");
  fs::create_directories(dir, ec);

  const fs::path orig = dir / "a.bin";
  ASSERT_TRUE(WriteBytes(orig, Bytes(64, 0x11)));

  // Missing input.
  EXPECT_EQ(RunCli({"apply", (dir / "missing.bin").string(), orig.string(), (dir / "o.bin").string()}), 2);
  EXPECT_EQ(RunCli({"inspect", (dir / "missing.ips").string()}), 2);

  // Not a patch.
  const fs::path junk = dir / "junk.ips";
  ASSERT_TRUE(WriteBytes(junk, Bytes{'N', 'O', 'P', 'E'}));
  EXPECT_EQ(RunCli({"apply", orig.string(), junk.string(), (dir / "o.bin").string()}), 3);
  EXPECT_EQ(RunCli({"inspect", junk.string()}), 3);

  // Truncated IPS record.
  const fs::path cut = dir / "cut.ips";
  ASSERT_TRUE(WriteBytes(cut, Bytes{'P', 'A', 'T', 'C', 'H', 0x00, 0x00, 0x01, 0x00, 0x05, 0xAA}));
  EXPECT_EQ(RunCli({"apply", orig.string(), cut.string(), (dir / "o.bin").string()}), 3);
  EXPECT_FALSE(fs::exists(dir / "o.bin"));

  fs::remove_all(dir, ec);
}

static void TestInspectStdoutJsonAndLog()
{
  std::error_code ec;
  const fs::path dir = MakeTempPath("rompatch_cli_log");
  fs::create_directories(dir, ec);

  const fs::path patch = dir / "p.ips";
  // One literal record and a truncation size.
  ASSERT_TRUE(WriteBytes(patch, Bytes{'P', 'A', 'T', 'C', 'H', 0x00, 0x00, 0x02, 0x00, 0x01, 0x7E, 'E', 'O', 'F',
                                      0x00, 0x00, 0x04}));
  EXPECT_EQ(RunCli({"inspect", patch.string(), "--json", "-"}), 0);
  EXPECT_EQ(RunCli({"inspect", patch.string(), "--records=0"}), 0);

  const fs::path log = dir / "logs" / "rompatch.log";
  EXPECT_EQ(RunCli({"--log", log.string(), "inspect", patch.string()}), 0);
  EXPECT_EQ(RunCli({"inspect", patch.string(), "--log=" + log.string(), "--log-keep", "2"}), 0);

  std::string text;
  rompatch::PatchError err;
  ASSERT_TRUE(rompatch::ReadFileText(log, text, err));
  EXPECT_TRUE(text.find("[OUT]") != std::string::npos);
  EXPECT_TRUE(text.find("Patch format: ips") != std::string::npos);
  // The previous run was rotated out of the way.
  EXPECT_TRUE(fs::exists(log.string() + ".1"));

  fs::remove_all(dir, ec);
}

int main()
{
  TestUsage();
  TestIpsCreateApplyVerify();
  TestIpsTruncationFlag();
  TestBpsWorkflow();
  TestFormatAliases();
  TestConfigFile();
  TestErrorsAndExitCodes();
  TestInspectStdoutJsonAndLog();

  if (g_failures == 0) {
    std::cout << "rompatch_cli_tests: OK\n";
    return 0;
  }

  std::cerr << "rompatch_cli_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
