#include "xsel/version.h"

#include <libxml/xmlversion.h>

#ifndef XSEL_VERSION
#define XSEL_VERSION "0.0.0"
#endif

#ifndef XSEL_GIT_COMMIT
#define XSEL_GIT_COMMIT "unknown"
#endif

#ifndef XSEL_GIT_DIRTY
#define XSEL_GIT_DIRTY 0
#endif

namespace xsel {

VersionInfo get_version_info() {
  VersionInfo info;
  info.version = XSEL_VERSION;
  info.git_commit = XSEL_GIT_COMMIT;
  info.git_dirty = (XSEL_GIT_DIRTY != 0);
  info.libxml2_version = LIBXML_DOTTED_VERSION;
  return info;
}

std::string version_string() {
  VersionInfo info = get_version_info();
  std::string out = info.version + " (" + info.git_commit;
  if (info.git_dirty) out += "-dirty";
  out += "; libxml2 " + info.libxml2_version + ")";
  return out;
}

}  // namespace xsel
