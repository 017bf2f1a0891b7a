#pragma once

#include <string>

namespace xsel {

/// Captures core build version, source provenance and the parser library it runs on.
/// MUST be stable and available to the CLI and library callers.
struct VersionInfo {
  std::string version;
  std::string git_commit;
  bool git_dirty = false;
  /// libxml2 version the core was compiled against.
  std::string libxml2_version;
};

/// Returns compile-time version/provenance for the current core build.
/// MUST not perform IO and MUST be safe to call frequently.
VersionInfo get_version_info();
/// Returns "<version> (<commit>[-dirty]; libxml2 <version>)".
std::string version_string();

}  // namespace xsel
