#include "refactor/RefactorEngine.hpp"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

#include <gtest/gtest.h>

using namespace w2n;
namespace fs = llvm::sys::fs;

class RefactorEngineTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_FALSE(fs::createUniqueDirectory("w2n-refactor", Dir));
    Opts = defaultScanOptions();
    Opts.root = std::string(Dir.str());
    Quoted = makeQuotedRewriter();
  }
  void TearDown() override { fs::remove_directories(Dir); }

  std::string file(const std::string& name, const std::string& content) {
    llvm::SmallString<128> p(Dir);
    llvm::sys::path::append(p, name);
    std::string err;
    EXPECT_TRUE(RefactorEngine::writeFile(std::string(p.str()), content, &err)) << err;
    return std::string(p.str());
  }

  static std::string slurp(const std::string& path) {
    std::string out, err;
    EXPECT_TRUE(RefactorEngine::readFile(path, out, &err)) << err;
    return out;
  }

  llvm::SmallString<128> Dir;
  ScanOptions Opts;
  std::unique_ptr<Rewriter> Quoted;
};

TEST_F(RefactorEngineTest, WritesConvertedFile) {
  auto f = file("a.ini", "p = \"C:\\\\Temp\\\\x\";\n");
  RefactorEngine engine(Opts, *Quoted);
  FileReport rep = engine.processFile(f);
  EXPECT_EQ(rep.status, FileStatus::Changed);
  EXPECT_EQ(rep.replacements, 1u);
  EXPECT_TRUE(rep.written);
  EXPECT_EQ(slurp(f), "p = \"C:/Temp/x\";\n");
  EXPECT_FALSE(fs::exists(f + ".bak"));
}

TEST_F(RefactorEngineTest, DryRunLeavesFileAlone) {
  const std::string original = "p = \"C:\\\\Temp\\\\x\";\n";
  auto f = file("a.ini", original);
  Opts.dryRun = true;
  RefactorEngine engine(Opts, *Quoted);
  FileReport rep = engine.processFile(f);
  EXPECT_EQ(rep.status, FileStatus::Changed);
  EXPECT_EQ(rep.replacements, 1u);
  EXPECT_FALSE(rep.written);
  EXPECT_EQ(slurp(f), original);
}

TEST_F(RefactorEngineTest, ZeroReplacementsNeverWrites) {
  const std::string original = "msg = \"Line1\\nLine2\";\nint x = 0;\n";
  auto f = file("b.cpp", original);
  Opts.backup = true;
  RefactorEngine engine(Opts, *Quoted);
  FileReport rep = engine.processFile(f);
  EXPECT_EQ(rep.status, FileStatus::Unchanged);
  EXPECT_EQ(rep.replacements, 0u);
  EXPECT_FALSE(rep.written);
  EXPECT_EQ(slurp(f), original);
  EXPECT_FALSE(fs::exists(f + ".bak"));
}

TEST_F(RefactorEngineTest, BackupKeepsOriginal) {
  const std::string original = "Dir='Saved\\Logs'\n";
  auto f = file("c.ini", original);
  Opts.backup = true;
  RefactorEngine engine(Opts, *Quoted);
  FileReport rep = engine.processFile(f);
  ASSERT_EQ(rep.status, FileStatus::Changed);
  EXPECT_EQ(slurp(f), "Dir='Saved/Logs'\n");
  EXPECT_EQ(slurp(f + ".bak"), original);
}

TEST_F(RefactorEngineTest, Latin1InputIsWrittenAsUtf8) {
  auto f = file("d.txt", "// caf\xE9\nq = \"C:\\\\Temp\";\n");
  RefactorEngine engine(Opts, *Quoted);
  FileReport rep = engine.processFile(f);
  ASSERT_EQ(rep.status, FileStatus::Changed);
  EXPECT_EQ(slurp(f), "// caf\xC3\xA9\nq = \"C:/Temp\";\n");
}

TEST_F(RefactorEngineTest, MissingFileFails) {
  llvm::SmallString<128> p(Dir);
  llvm::sys::path::append(p, "gone.cpp");
  RefactorEngine engine(Opts, *Quoted);
  FileReport rep = engine.processFile(std::string(p.str()));
  EXPECT_EQ(rep.status, FileStatus::Failed);
  EXPECT_FALSE(rep.message.empty());
  EXPECT_FALSE(rep.written);
}

TEST_F(RefactorEngineTest, AggressiveRewriterReachesUnquotedTokens) {
  auto f = file("build.bat", "copy Foo\\Bar\\Baz.txt here\n");
  auto aggressive = makeAggressiveRewriter();
  RefactorEngine engine(Opts, *aggressive);
  FileReport rep = engine.processFile(f);
  EXPECT_EQ(rep.status, FileStatus::Changed);
  EXPECT_EQ(slurp(f), "copy Foo/Bar/Baz.txt here\n");
}

TEST_F(RefactorEngineTest, RunContinuesPastFailures) {
  llvm::SmallString<128> missing(Dir);
  llvm::sys::path::append(missing, "missing.ini");
  std::vector<std::string> files = {
      file("a.ini", "p = 'Saved\\Logs'\nq = 'Content\\Maps'\n"),
      std::string(missing.str()),
      file("b.ini", "nothing = 'here'\n"),
      file("c.ini", "r = \"C:\\\\Temp\"\n"),
  };

  std::string outText, errText;
  llvm::raw_string_ostream out(outText), err(errText);
  RefactorEngine engine(Opts, *Quoted);
  RunSummary sum = engine.run(files, out, err);
  out.flush();
  err.flush();

  EXPECT_EQ(sum.filesChanged, 2u);
  EXPECT_EQ(sum.replacements, 3u);
  EXPECT_EQ(sum.failures, 1u);
  EXPECT_NE(outText.find("[FIX] " + files[0] + " - 2 path string(s) updated"), std::string::npos);
  EXPECT_NE(outText.find("[FIX] " + files[3] + " - 1 path string(s) updated"), std::string::npos);
  EXPECT_EQ(outText.find(files[2]), std::string::npos);
  EXPECT_NE(errText.find("[ERROR] " + files[1]), std::string::npos);
}

TEST_F(RefactorEngineTest, RunReportsDryRunAndVerbose) {
  auto changed = file("a.ini", "p = 'Saved\\Logs'\n");
  auto kept = file("b.ini", "x = 1\n");
  Opts.dryRun = true;
  Opts.verbose = true;

  std::string outText, errText;
  llvm::raw_string_ostream out(outText), err(errText);
  RefactorEngine engine(Opts, *Quoted);
  RunSummary sum = engine.run({changed, kept}, out, err);
  out.flush();

  EXPECT_EQ(sum.filesChanged, 1u);
  EXPECT_NE(outText.find("[DRY] " + changed), std::string::npos);
  EXPECT_NE(outText.find("[KEEP] " + kept), std::string::npos);
  EXPECT_EQ(slurp(changed), "p = 'Saved\\Logs'\n");
  EXPECT_TRUE(errText.empty());
}

TEST_F(RefactorEngineTest, WriteKeepsPermissionsAndLeavesNoTemporaries) {
  auto f = file("perm.ini", "p = 'Saved\\Logs'\n");
  const fs::perms mode = fs::owner_read | fs::owner_write | fs::group_read;
  ASSERT_FALSE(fs::setPermissions(f, mode));

  RefactorEngine engine(Opts, *Quoted);
  FileReport rep = engine.processFile(f);
  ASSERT_EQ(rep.status, FileStatus::Changed);
  EXPECT_EQ(slurp(f), "p = 'Saved/Logs'\n");

  llvm::ErrorOr<fs::perms> after = fs::getPermissions(f);
  ASSERT_TRUE(bool(after));
  EXPECT_EQ(*after, mode);

  std::vector<std::string> entries;
  std::error_code ec;
  for (fs::directory_iterator it(Dir, ec), end; it != end && !ec; it.increment(ec))
    entries.push_back(llvm::sys::path::filename(it->path()).str());
  ASSERT_FALSE(ec);
  EXPECT_EQ(entries, std::vector<std::string>{"perm.ini"});
}

TEST_F(RefactorEngineTest, FailedReplacementKeepsTheTarget) {
  // The target is a non-empty directory, so the final rename cannot land.
  llvm::SmallString<128> target(Dir);
  llvm::sys::path::append(target, "target.ini");
  ASSERT_FALSE(fs::create_directories(target));
  auto inner = file("target.ini/keep.txt", "original\n");

  std::string err;
  EXPECT_FALSE(RefactorEngine::writeFile(std::string(target.str()), "new\n", &err));
  EXPECT_FALSE(err.empty());
  EXPECT_TRUE(fs::is_directory(target));
  EXPECT_EQ(slurp(inner), "original\n");
}
