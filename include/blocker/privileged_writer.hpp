#ifndef SITEBLOCKER_PRIVILEGED_WRITER_HPP
#define SITEBLOCKER_PRIVILEGED_WRITER_HPP

#include "blocker/logger_supervisor.hpp"
#include "utilities/command_runner.hpp"
#include "utilities/settings.hpp"

#include <optional>
#include <string>
#include <vector>

namespace siteblocker {

/**
 * @brief One command of the elevated script.
 *
 * Required steps gate the outcome. A best-effort step is wrapped so its
 * failure cannot change the script's exit status.
 */
struct PrivilegedStep {
  std::string command;
  bool required = true;
};

/**
 * @brief Applies a domain set to the system hosts file with root rights.
 *
 * The new content is computed unprivileged and staged in a private temporary
 * file. A single elevated `/bin/sh -c` invocation then backs up the hosts
 * file, replaces it, restores its mode, flushes resolver caches and starts or
 * stops the logger daemon. The operator sees at most one prompt per call.
 */
class PrivilegedWriter {
public:
  PrivilegedWriter(const Settings &settings, CommandRunner &runner,
                   LoggerDaemonSupervisor &supervisor);

  /**
   * @brief Rewrite the managed block so it lists exactly @p domains.
   *
   * An empty list removes the block and stops the logger daemon.
   *
   * @throws SafetyCheckError if the hosts file is unreadable or lacks a
   *         loopback localhost entry.
   * @throws PrivilegedWriteError if staging fails, elevation is refused or
   *         cancelled, or a required step fails.
   */
  void apply(const std::vector<std::string> &domains);

  /// Read the system hosts file. @throws SafetyCheckError when unreadable.
  std::string readHosts() const;

  /// @throws SafetyCheckError unless @p content mentions 127.0.0.1 and localhost.
  static void checkHostsContent(const std::string &content);

  /**
   * @brief Ordered steps for one transaction.
   * @param stagedPath Temporary file holding the new hosts content.
   * @param loggerScript Staged logger script, if one was found.
   */
  std::vector<PrivilegedStep>
  planSteps(const std::vector<std::string> &domains,
            const std::string &stagedPath,
            const std::optional<std::string> &loggerScript) const;

  /// Join steps with "&&", wrapping best-effort ones as `{ cmd || true ; }`.
  static std::string composeScript(const std::vector<PrivilegedStep> &steps);

private:
  Settings settings_;
  CommandRunner &runner_;
  LoggerDaemonSupervisor &supervisor_;
};

} // namespace siteblocker

#endif // SITEBLOCKER_PRIVILEGED_WRITER_HPP
