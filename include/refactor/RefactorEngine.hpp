#pragma once
#include "config/Options.hpp"
#include "convert/Rewriter.hpp"
#include "refactor/FileReport.hpp"
#include <string>
#include <vector>

namespace llvm { class raw_ostream; }

namespace w2n {

// Whole-file read -> rewrite -> overwrite. A file is only written when the
// rewriter reports at least one replacement and dry-run is off.
class RefactorEngine {
public:
  RefactorEngine(const ScanOptions& opts, const Rewriter& rewriter);

  FileReport processFile(const std::string& path) const;

  // Process every file; one bad file never stops the run. Results go to
  // `out`, diagnostics to `err`.
  RunSummary run(const std::vector<std::string>& files,
                 llvm::raw_ostream& out, llvm::raw_ostream& err) const;

  static bool readFile(const std::string& path, std::string& out, std::string* error);
  static bool writeFile(const std::string& path, const std::string& data, std::string* error);

private:
  const ScanOptions& Opts;
  const Rewriter& Rw;
};

} // namespace w2n
