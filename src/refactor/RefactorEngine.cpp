#include "refactor/RefactorEngine.hpp"
#include "fs/TextCodec.hpp"

#include "llvm/Support/Error.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/raw_ostream.h"

namespace fs = llvm::sys::fs;
namespace w2n {

RefactorEngine::RefactorEngine(const ScanOptions& opts, const Rewriter& rewriter)
    : Opts(opts), Rw(rewriter) {}

bool RefactorEngine::readFile(const std::string& path, std::string& out, std::string* error) {
  auto buf = llvm::MemoryBuffer::getFile(path, /*IsText=*/false,
                                         /*RequiresNullTerminator=*/false);
  if (!buf) {
    if (error) *error = buf.getError().message();
    return false;
  }
  out = (*buf)->getBuffer().str();
  return true;
}

// Written to a temporary beside `path` and renamed over it, so a failed
// write leaves the original untouched. The original's permissions carry over.
bool RefactorEngine::writeFile(const std::string& path, const std::string& data, std::string* error) {
  llvm::ErrorOr<fs::perms> mode = fs::getPermissions(path);
  llvm::Error e = llvm::writeToOutput(path, [&](llvm::raw_ostream& os) {
    os << data;
    return llvm::Error::success();
  });
  if (e) {
    if (error) *error = llvm::toString(std::move(e));
    return false;
  }
  if (mode) {
    if (std::error_code ec = fs::setPermissions(path, *mode)) {
      if (error) *error = "cannot restore permissions: " + ec.message();
      return false;
    }
  }
  return true;
}

FileReport RefactorEngine::processFile(const std::string& path) const {
  FileReport rep;
  rep.file = path;

  std::string raw, err;
  if (!readFile(path, raw, &err)) {
    rep.status = FileStatus::Failed;
    rep.message = err;
    return rep;
  }

  auto text = decodeText(raw);
  if (!text) {
    rep.status = FileStatus::Skipped;
    rep.message = "Cannot decode";
    return rep;
  }

  TransformResult res = Rw.rewrite(*text);
  rep.replacements = res.replacements;
  if (res.replacements == 0) return rep;
  rep.status = FileStatus::Changed;
  if (Opts.dryRun) return rep;

  if (Opts.backup) {
    if (std::error_code ec = fs::copy_file(path, path + ".bak")) {
      rep.status = FileStatus::Failed;
      rep.message = "backup failed: " + ec.message();
      return rep;
    }
  }
  if (!writeFile(path, res.text, &err)) {
    rep.status = FileStatus::Failed;
    rep.message = err;
    return rep;
  }
  rep.written = true;
  return rep;
}

RunSummary RefactorEngine::run(const std::vector<std::string>& files,
                               llvm::raw_ostream& out, llvm::raw_ostream& err) const {
  RunSummary sum;
  const char* tag = Opts.dryRun ? "[DRY] " : "[FIX] ";
  for (const auto& f : files) {
    FileReport rep = processFile(f);
    switch (rep.status) {
    case FileStatus::Changed:
      out << tag << rep.file << " - " << rep.replacements << " path string(s) updated\n";
      ++sum.filesChanged;
      sum.replacements += rep.replacements;
      break;
    case FileStatus::Unchanged:
      if (Opts.verbose) out << "[KEEP] " << rep.file << "\n";
      break;
    case FileStatus::Skipped:
      err << "[SKIP] " << rep.message << " " << rep.file << "\n";
      break;
    case FileStatus::Failed:
      err << "[ERROR] " << rep.file << ": " << rep.message << "\n";
      ++sum.failures;
      break;
    }
  }
  return sum;
}

} // namespace w2n
