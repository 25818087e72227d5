#pragma once
#include "config/Options.hpp"
#include "llvm/Support/raw_ostream.h"
#include <string>
#include <vector>

namespace w2n {

// Shell-style glob match against a '/'-separated relative path. '*' also
// crosses '/', and a leading "**/" may match zero directories.
// Returns false and sets *error for a malformed pattern.
bool matchGlob(const std::string& pattern, const std::string& relPath,
               std::string* error = nullptr);

// Extension filter: last extension of `path` is listed (or anyExtension).
bool hasWantedExtension(const std::string& path, const ScanOptions& opts);

// Walk opts.root and collect files passing the extension, include and
// exclude filters, sorted. Fails before touching anything when the root is
// missing or a glob is malformed. Unreadable directories are reported to
// `diag` and skipped.
bool collectFiles(const ScanOptions& opts, std::vector<std::string>& out,
                  std::string* error, llvm::raw_ostream& diag = llvm::errs());

} // namespace w2n
