#include "fs/SourceWalker.hpp"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/GlobPattern.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <optional>

namespace fs = llvm::sys::fs;
namespace path = llvm::sys::path;

namespace w2n {

namespace {

// A pattern plus, for "**/x", its zero-directory form "x".
struct CompiledGlob {
  llvm::GlobPattern full;
  std::optional<llvm::GlobPattern> rootLevel;

  bool match(llvm::StringRef rel) const {
    return full.match(rel) || (rootLevel && rootLevel->match(rel));
  }
};

bool compileGlob(const std::string& pattern, CompiledGlob& out, std::string* error) {
  auto full = llvm::GlobPattern::create(pattern);
  if (!full) {
    if (error) *error = "Bad glob '" + pattern + "': " + llvm::toString(full.takeError());
    return false;
  }
  out.full = std::move(*full);
  out.rootLevel.reset();
  llvm::StringRef p(pattern);
  if (p.startswith("**/")) {
    auto tail = llvm::GlobPattern::create(p.drop_front(3));
    if (!tail) {
      if (error) *error = "Bad glob '" + pattern + "': " + llvm::toString(tail.takeError());
      return false;
    }
    out.rootLevel = std::move(*tail);
  }
  return true;
}

bool compileAll(const std::vector<std::string>& patterns,
                std::vector<CompiledGlob>& out, std::string* error) {
  for (const auto& p : patterns) {
    CompiledGlob g;
    if (!compileGlob(p, g, error)) return false;
    out.push_back(std::move(g));
  }
  return true;
}

bool matchAny(const std::vector<CompiledGlob>& globs, llvm::StringRef rel) {
  return std::any_of(globs.begin(), globs.end(),
                     [&](const CompiledGlob& g) { return g.match(rel); });
}

} // namespace

bool matchGlob(const std::string& pattern, const std::string& relPath, std::string* error) {
  CompiledGlob g;
  if (!compileGlob(pattern, g, error)) return false;
  return g.match(relPath);
}

bool hasWantedExtension(const std::string& file, const ScanOptions& opts) {
  if (opts.anyExtension) return true;
  std::string ext = path::extension(file).str();
  return std::find(opts.extensions.begin(), opts.extensions.end(), ext) !=
         opts.extensions.end();
}

bool collectFiles(const ScanOptions& opts, std::vector<std::string>& out,
                  std::string* error, llvm::raw_ostream& diag) {
  llvm::SmallString<256> root;
  if (fs::real_path(opts.root, root) || !fs::is_directory(root)) {
    if (error) *error = "Root not found: " + opts.root;
    return false;
  }

  std::vector<CompiledGlob> includes, excludes;
  if (!compileAll(opts.includes, includes, error) ||
      !compileAll(opts.excludes, excludes, error))
    return false;

  std::error_code ec;
  fs::recursive_directory_iterator it(root, ec, /*follow_symlinks=*/false), end;
  if (ec) diag << "[ERROR] " << root << ": " << ec.message() << "\n";
  while (it != end) {
    const std::string file = it->path();
    if (it->type() == fs::file_type::directory_file) {
      // Open it here: the iterator drops errors from descending.
      std::error_code dirEc;
      fs::directory_iterator listing(file, dirEc, /*follow_symlinks=*/false);
      if (dirEc) {
        diag << "[ERROR] " << file << ": " << dirEc.message() << "\n";
        it.no_push();
      }
    } else if (fs::is_regular_file(file) && hasWantedExtension(file, opts)) {
      llvm::StringRef rel = llvm::StringRef(file).drop_front(root.size());
      rel = rel.ltrim("/\\");
      std::string relPosix = path::convert_to_slash(rel);
      if (matchAny(includes, relPosix) && !matchAny(excludes, relPosix))
        out.push_back(file);
    }

    it.increment(ec);
    if (ec) {
      diag << "[ERROR] " << path::parent_path(file) << ": " << ec.message() << "\n";
      ec.clear();
      // Stuck on the same entry: give up on the rest of the walk.
      if (it != end && it->path() == file) break;
    }
  }

  std::sort(out.begin(), out.end());
  return true;
}

} // namespace w2n
