#include "sqlscribe/version.h"

#ifndef SQLSCRIBE_VERSION
#define SQLSCRIBE_VERSION "0.0.0"
#endif

#ifndef SQLSCRIBE_GIT_COMMIT
#define SQLSCRIBE_GIT_COMMIT "unknown"
#endif

#ifndef SQLSCRIBE_GIT_DIRTY
#define SQLSCRIBE_GIT_DIRTY 0
#endif

namespace sqlscribe {

VersionInfo get_version_info() {
  return VersionInfo{SQLSCRIBE_VERSION, SQLSCRIBE_GIT_COMMIT, SQLSCRIBE_GIT_DIRTY != 0};
}

std::string version_string() {
  const VersionInfo info = get_version_info();
  std::string commit = info.git_commit;
  if (info.git_dirty) commit += "-dirty";
  return info.version + " (" + commit + ")";
}

}  // namespace sqlscribe
