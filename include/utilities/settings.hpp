#ifndef SITEBLOCKER_SETTINGS_HPP
#define SITEBLOCKER_SETTINGS_HPP

#include <string>
#include <vector>

namespace siteblocker {

/**
 * @brief Runtime options for the blocker, read from a YAML file.
 *
 * Every field has a working Linux default, so a missing settings file is
 * not an error. Environment variables override the file.
 */
struct Settings {
  std::string hostsPath = "/etc/hosts";
  std::string backupPath = "/etc/hosts.site-blocker.bak";
  std::string pidFile = "/tmp/site-blocker-logger.pid";
  std::string loggerStagingPath = "/tmp/site-blocker-access-logger.py";
  std::string resourceDir = "/usr/share/site-blocker";
  std::string pythonInterpreter = "/usr/bin/python3";
  /// Program and leading arguments used to gain root; empty runs unelevated.
  std::vector<std::string> elevationCommand{"pkexec"};
  std::string flushCacheCommand = "resolvectl flush-caches";
  std::string restartResolverCommand = "systemctl try-restart systemd-resolved";
  std::string logLevel = "INFO";
};

/**
 * @brief Load settings from @p path, falling back to defaults.
 *
 * Unknown keys are ignored. A file that exists but cannot be parsed is
 * logged and the defaults are kept.
 */
Settings loadSettings(const std::string &path);

/** Apply SITEBLOCKER_* environment overrides on top of @p settings. */
void applyEnvironmentOverrides(Settings &settings);

} // namespace siteblocker

#endif // SITEBLOCKER_SETTINGS_HPP
