#include "config/Options.hpp"
#include "convert/Rewriter.hpp"
#include "fs/SourceWalker.hpp"
#include "refactor/RefactorEngine.hpp"

#include "llvm/Support/CommandLine.h"
#include "llvm/Support/raw_ostream.h"

using namespace w2n;

static llvm::cl::OptionCategory ToolCat("win2nix options");

static llvm::cl::opt<std::string> Root(
  llvm::cl::Positional, llvm::cl::desc("<root directory>"),
  llvm::cl::Required, llvm::cl::cat(ToolCat));

static llvm::cl::opt<bool> DryRun(
  "dry-run", llvm::cl::desc("Report changes but do not modify files"),
  llvm::cl::init(false), llvm::cl::cat(ToolCat));

static llvm::cl::list<std::string> Exts(
  "ext", llvm::cl::desc("File extensions to process (replaces the defaults)"),
  llvm::cl::CommaSeparated, llvm::cl::ZeroOrMore, llvm::cl::cat(ToolCat));

static llvm::cl::opt<bool> AnyExt(
  "any-ext", llvm::cl::desc("Process files regardless of extension"),
  llvm::cl::init(false), llvm::cl::cat(ToolCat));

static llvm::cl::list<std::string> Includes(
  "include", llvm::cl::desc("Glob(s) to include, relative to root (default **/*)"),
  llvm::cl::CommaSeparated, llvm::cl::ZeroOrMore, llvm::cl::cat(ToolCat));

static llvm::cl::list<std::string> Excludes(
  "exclude",
  llvm::cl::desc("Glob(s) to exclude (default **/Binaries/**, **/Intermediate/**, **/.git/**)"),
  llvm::cl::CommaSeparated, llvm::cl::ZeroOrMore, llvm::cl::cat(ToolCat));

static llvm::cl::opt<bool> Aggressive(
  "aggressive", llvm::cl::desc("Also convert unquoted Windows-like paths (use with care)"),
  llvm::cl::init(false), llvm::cl::cat(ToolCat));

static llvm::cl::opt<bool> Backup(
  "backup", llvm::cl::desc("Write .bak copies before overwriting"),
  llvm::cl::init(false), llvm::cl::cat(ToolCat));

static llvm::cl::opt<bool> Verbose(
  "verbose", llvm::cl::desc("Also list files left unchanged"),
  llvm::cl::init(false), llvm::cl::cat(ToolCat));

int main(int argc, const char** argv) {
  llvm::cl::HideUnrelatedOptions(ToolCat);
  llvm::cl::ParseCommandLineOptions(argc, argv, "Convert Windows path slashes to POSIX slashes\n");

  ScanOptions opts = defaultScanOptions();
  opts.root = Root;
  if (!Exts.empty()) opts.extensions.assign(Exts.begin(), Exts.end());
  if (!Includes.empty()) opts.includes.assign(Includes.begin(), Includes.end());
  if (!Excludes.empty()) opts.excludes.assign(Excludes.begin(), Excludes.end());
  opts.anyExtension = AnyExt;
  opts.aggressive = Aggressive;
  opts.dryRun = DryRun;
  opts.backup = Backup;
  opts.verbose = Verbose;

  std::vector<std::string> files;
  std::string err;
  if (!collectFiles(opts, files, &err)) {
    llvm::errs() << "[ERROR] " << err << "\n";
    return 1;
  }

  auto rewriter = makeRewriter(opts.aggressive);
  RefactorEngine engine(opts, *rewriter);
  RunSummary sum = engine.run(files, llvm::outs(), llvm::errs());

  llvm::outs() << "[SUMMARY] Files changed: " << sum.filesChanged
               << ", path strings updated: " << sum.replacements << "\n";
  return 0;
}
