#pragma once
#include <string>

namespace w2n {

enum class FileStatus { Unchanged, Changed, Skipped, Failed };

struct FileReport {
  std::string file;
  FileStatus  status = FileStatus::Unchanged;
  unsigned    replacements = 0; // path strings rewritten (or that would be)
  bool        written = false;  // file content was replaced on disk
  std::string message;          // cause for Skipped/Failed
};

struct RunSummary {
  unsigned filesChanged = 0;
  unsigned replacements = 0;
  unsigned failures = 0;
};

} // namespace w2n
