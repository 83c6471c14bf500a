#include "jnav/version.h"

namespace jnav {

namespace {

#ifndef JNAV_VERSION
#define JNAV_VERSION "0.0.0"
#endif

#ifndef JNAV_GIT_COMMIT
#define JNAV_GIT_COMMIT "unknown"
#endif

#ifndef JNAV_GIT_DIRTY
#define JNAV_GIT_DIRTY 0
#endif

}  // namespace

VersionInfo get_version_info() {
  VersionInfo info;
  info.version = JNAV_VERSION;
  info.git_commit = JNAV_GIT_COMMIT;
  info.git_dirty = (JNAV_GIT_DIRTY != 0);
  return info;
}

std::string version_string() {
  VersionInfo info = get_version_info();
  std::string out = info.version + " (" + info.git_commit;
  if (info.git_dirty) out += "-dirty";
  out += ")";
  return out;
}

}  // namespace jnav
