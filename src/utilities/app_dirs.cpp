#include "utilities/app_dirs.hpp"

#include <cstdlib>

namespace siteblocker {

static std::string dataDir = [] {
  const char *env = std::getenv("SITEBLOCKER_DATA_DIR");
  if (env && env[0] != '\0')
    return std::string(env);
  const char *xdg = std::getenv("XDG_DATA_HOME");
  if (xdg && xdg[0] != '\0')
    return std::string(xdg) + "/site-blocker";
  const char *home = std::getenv("HOME");
  if (home && home[0] != '\0')
    return std::string(home) + "/.local/share/site-blocker";
  return std::string("/tmp/site-blocker");
}();

void setDataDir(const std::string &dir) { dataDir = dir; }

const std::string &getDataDir() { return dataDir; }

std::string logsDir() { return getDataDir() + "/logs"; }

std::string configPath() { return getDataDir() + "/blocked.json"; }

std::string settingsPath() {
  const char *env = std::getenv("SITEBLOCKER_CONFIG");
  if (env && env[0] != '\0')
    return std::string(env);
  return getDataDir() + "/settings.yaml";
}

std::string accessLogPath() { return getDataDir() + "/access_log.jsonl"; }

std::string legacyAccessLogPath() { return getDataDir() + "/access_log.json"; }

} // namespace siteblocker
