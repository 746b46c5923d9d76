#include "blocker/site_blocker.hpp"
#include "blocker/errors.hpp"
#include "blocker/hosts_block.hpp"
#include "utilities/logger.h"

#include <utility>

namespace siteblocker {

SiteBlocker::SiteBlocker(const Settings &settings, const std::string &configPath,
                         AccessLogReader accessLog, CommandRunner &runner,
                         LoggerDaemonSupervisor::SignalProbe probe)
    : settings_(settings), config_(configPath), accessLog_(std::move(accessLog)),
      supervisor_(settings, runner, std::move(probe)),
      writer_(settings, runner, supervisor_) {}

std::vector<std::string> SiteBlocker::getDomains() const {
  return config_.load().domains;
}

std::vector<std::string> SiteBlocker::addDomain(const std::string &domain) {
  return addDomains({domain});
}

std::vector<std::string> SiteBlocker::removeDomain(const std::string &domain) {
  return removeDomains({domain});
}

std::vector<std::string>
SiteBlocker::addDomains(const std::vector<std::string> &domains) {
  Logger::getInstance().log(LogLevel::INFO,
                            "add-domain: " + std::to_string(domains.size()) +
                                " requested");
  auto added = config_.add(domains);
  if (!added.empty())
    syncHostsIfEnabled("add-domain");
  return added;
}

std::vector<std::string>
SiteBlocker::removeDomains(const std::vector<std::string> &domains) {
  Logger::getInstance().log(LogLevel::INFO,
                            "remove-domain: " + std::to_string(domains.size()) +
                                " requested");
  auto removed = config_.remove(domains);
  if (!removed.empty())
    syncHostsIfEnabled("remove-domain");
  return removed;
}

void SiteBlocker::syncHostsIfEnabled(const char *operation) {
  try {
    Config config = config_.load();
    if (config.enabled) {
      Logger::getInstance().log(LogLevel::INFO, std::string(operation) +
                                                    ": blocking enabled, syncing hosts");
      writer_.apply(config.domains);
    }
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::WARN, std::string(operation) +
                                                  ": hosts sync failed: " + e.what());
  }
}

bool SiteBlocker::getStatus() const {
  try {
    Config config = config_.load();
    bool active = hosts::isActive(writer_.readHosts());
    Logger::getInstance().log(LogLevel::DEBUG,
                              std::string("get-status: enabled=") +
                                  (config.enabled ? "true" : "false") +
                                  " active=" + (active ? "true" : "false"));
    return config.enabled && active;
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::WARN,
                              std::string("get-status failed: ") + e.what());
    return false;
  }
}

void SiteBlocker::enableBlocking() {
  Config config = config_.load();
  if (config.domains.empty()) {
    Logger::getInstance().log(LogLevel::WARN, "enable-blocking: no domains configured");
    throw NoDomainsConfiguredError();
  }
  writer_.apply(config.domains);
  config_.setEnabled(true);
  Logger::getInstance().log(LogLevel::INFO, "enable-blocking: done");
}

void SiteBlocker::disableBlocking() {
  writer_.apply({});
  config_.setEnabled(false);
  Logger::getInstance().log(LogLevel::INFO, "disable-blocking: done");
}

std::vector<AccessLogEntry> SiteBlocker::getAccessLog(std::optional<int> days) const {
  auto entries = accessLog_.read(days);
  Logger::getInstance().log(LogLevel::DEBUG, "get-access-log: " +
                                                 std::to_string(entries.size()) +
                                                 " entries");
  return entries;
}

void SiteBlocker::reconcileOnStartup() {
  Config config = config_.load();

  std::optional<std::string> current;
  try {
    current = writer_.readHosts();
  } catch (const SafetyCheckError &e) {
    Logger::getInstance().log(LogLevel::WARN,
                              std::string("startup: ") + e.what());
  }
  const bool active = current && hosts::isActive(*current);
  if (active) {
    Logger::getInstance().log(LogLevel::DEBUG,
                              "startup: hosts block lists " +
                                  std::to_string(hosts::blockedDomains(*current).size()) +
                                  " name(s)");
  }

  // Configs from before the enabled flag existed: trust the hosts file.
  if (!config.enabled && active && !config.domains.empty()) {
    config_.setEnabled(true);
    config = config_.load();
    Logger::getInstance().log(LogLevel::INFO,
                              "startup: migrated enabled flag from active hosts state");
  }

  const bool shouldBeEnabled = config.enabled && !config.domains.empty();
  Logger::getInstance().log(LogLevel::INFO,
                            std::string("startup: shouldBeEnabled=") +
                                (shouldBeEnabled ? "true" : "false") +
                                " active=" + (active ? "true" : "false"));
  if (!shouldBeEnabled)
    return;

  if (!current || !active || hosts::needsSync(*current, config.domains)) {
    try {
      Logger::getInstance().log(LogLevel::INFO, "startup: re-syncing hosts file");
      writer_.apply(config.domains);
    } catch (const SiteBlockerError &e) {
      Logger::getInstance().log(LogLevel::WARN,
                                std::string("startup: hosts sync failed: ") + e.what());
    }
  }

  if (!supervisor_.isRunning()) {
    Logger::getInstance().log(LogLevel::INFO,
                              "startup: logger not running, attempting start");
    supervisor_.ensureRunning();
  }
}

} // namespace siteblocker
