#ifndef SITEBLOCKER_SITE_BLOCKER_HPP
#define SITEBLOCKER_SITE_BLOCKER_HPP

#include "blocker/access_log.hpp"
#include "blocker/config_store.hpp"
#include "blocker/logger_supervisor.hpp"
#include "blocker/privileged_writer.hpp"
#include "utilities/command_runner.hpp"
#include "utilities/settings.hpp"

#include <optional>
#include <string>
#include <vector>

namespace siteblocker {

/**
 * @brief Operations exposed to the user interface.
 *
 * The config file is the source of truth. Hosts file synchronisation after
 * an add or remove is best effort: a failed sync is logged and the config
 * change stands.
 */
class SiteBlocker {
public:
  /**
   * @param settings Runtime settings (hosts path, elevation, logger paths).
   * @param configPath Location of blocked.json.
   * @param accessLog Reader over the daemon's logs.
   * @param runner Runs the elevated helper; must outlive this object.
   */
  SiteBlocker(const Settings &settings, const std::string &configPath,
              AccessLogReader accessLog, CommandRunner &runner,
              LoggerDaemonSupervisor::SignalProbe probe =
                  LoggerDaemonSupervisor::defaultProbe());

  std::vector<std::string> getDomains() const;
  std::vector<std::string> addDomain(const std::string &domain);
  std::vector<std::string> removeDomain(const std::string &domain);

  /**
   * @brief Add or remove several domains with at most one hosts sync.
   *
   * Every input is normalised before the config is touched, so one invalid
   * entry leaves the list unchanged.
   */
  std::vector<std::string> addDomains(const std::vector<std::string> &domains);
  std::vector<std::string> removeDomains(const std::vector<std::string> &domains);

  /// True only when the enabled flag is set and the managed block exists.
  bool getStatus() const;

  /// @throws NoDomainsConfiguredError before any privileged action.
  void enableBlocking();
  void disableBlocking();

  std::vector<AccessLogEntry> getAccessLog(std::optional<int> days) const;

  /**
   * @brief Bring the hosts file, flag and daemon back in line at startup.
   *
   * Migrates a missing enabled flag from an existing block, re-applies a
   * stale or missing block, and starts the logger daemon if blocking is on.
   */
  void reconcileOnStartup();

  LoggerDaemonSupervisor &supervisor() { return supervisor_; }

private:
  void syncHostsIfEnabled(const char *operation);

  Settings settings_;
  ConfigStore config_;
  AccessLogReader accessLog_;
  LoggerDaemonSupervisor supervisor_;
  PrivilegedWriter writer_;
};

} // namespace siteblocker

#endif // SITEBLOCKER_SITE_BLOCKER_HPP
