#ifndef SITEBLOCKER_LOGGER_SUPERVISOR_HPP
#define SITEBLOCKER_LOGGER_SUPERVISOR_HPP

#include "utilities/command_runner.hpp"
#include "utilities/settings.hpp"

#include <functional>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace siteblocker {

/**
 * @brief Tracks and starts the external access-logger daemon.
 *
 * The daemon is identified by the pid file named in Settings. Starting it
 * needs root, so the start command goes through the configured elevation
 * prefix. A daemon that fails to start only degrades access logging.
 */
class LoggerDaemonSupervisor {
public:
  /// Sends signal 0 to a pid; returns 0 on success or the errno value.
  using SignalProbe = std::function<int(pid_t)>;

  LoggerDaemonSupervisor(const Settings &settings, CommandRunner &runner,
                         SignalProbe probe = defaultProbe());

  static SignalProbe defaultProbe();

  /**
   * @brief Parse pid file content.
   * @return The pid if @p text is a positive decimal integer, else nullopt.
   */
  static std::optional<pid_t> parsePid(const std::string &text);

  /**
   * EPERM counts as alive: a root daemon cannot be signalled by an
   * unprivileged caller but still exists.
   */
  bool isProcessAlive(pid_t pid) const;

  bool isRunning() const;

  /** Start the daemon unless it is already running. Never throws. */
  void ensureRunning();

  /// Packaged resource path first, then the development tree.
  std::vector<std::string> candidateScriptPaths() const;

  /**
   * @brief Locate the logger script and copy it to the staging path.
   *
   * The elevated helper may not be able to read the source location, so
   * the staged copy is made world readable.
   */
  std::optional<std::string> resolveLoggerScript() const;

  /// Real invoking user: SUDO_USER, USER, then the passwd entry of getuid().
  static std::string realUser();

  std::string startCommand(const std::string &script,
                           const std::string &user) const;
  std::string stopCommand(const std::string &script) const;

private:
  void start();

  Settings settings_;
  CommandRunner &runner_;
  SignalProbe probe_;
};

} // namespace siteblocker

#endif // SITEBLOCKER_LOGGER_SUPERVISOR_HPP
