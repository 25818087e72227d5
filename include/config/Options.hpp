#pragma once
#include <string>
#include <vector>

namespace w2n {

struct ScanOptions {
  std::string root;
  std::vector<std::string> extensions; // last extension, eg. ".cpp"
  bool anyExtension = false;           // ignore `extensions`
  std::vector<std::string> includes;   // globs relative to root
  std::vector<std::string> excludes;   // win over includes
  bool aggressive = false;             // also convert unquoted tokens
  bool dryRun = false;                 // report only
  bool backup = false;                 // keep <file>.bak before writing
  bool verbose = false;                // report untouched files too
};

// Unreal/MSBuild/C++ sources and configs.
inline std::vector<std::string> defaultExtensions() {
  return {".uplugin", ".uproject",
          ".Build.cs", ".Target.cs", ".cs",
          ".ini", ".txt", ".json", ".props", ".xml", ".bat", ".cmd",
          ".cpp", ".h", ".hpp"};
}

inline std::vector<std::string> defaultIncludes() { return {"**/*"}; }

inline std::vector<std::string> defaultExcludes() {
  return {"**/Binaries/**", "**/Intermediate/**", "**/.git/**"};
}

inline ScanOptions defaultScanOptions() {
  ScanOptions o;
  o.extensions = defaultExtensions();
  o.includes = defaultIncludes();
  o.excludes = defaultExcludes();
  return o;
}

} // namespace w2n
