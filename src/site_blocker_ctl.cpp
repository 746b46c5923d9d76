#include "blocker/access_log.hpp"
#include "blocker/errors.hpp"
#include "blocker/site_blocker.hpp"
#include "utilities/app_dirs.hpp"
#include "utilities/command_runner.hpp"
#include "utilities/logger.h"
#include "utilities/settings.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace siteblocker;

static void printUsage(const char *prog) {
  std::cout << "Usage: " << prog << " <command> [args]\n"
            << "  list                 show configured domains\n"
            << "  add <domain>...      add domains to the block list\n"
            << "  remove <domain>...   remove domains from the block list\n"
            << "  status               print whether blocking is active\n"
            << "  enable               write the hosts block (asks for root)\n"
            << "  disable              remove the hosts block (asks for root)\n"
            << "  log [days]           print recorded access attempts\n"
            << "  reconcile            repair hosts/flag/daemon after startup\n";
}

static void printDomains(const std::vector<std::string> &domains) {
  for (const auto &d : domains)
    std::cout << d << std::endl;
}

int main(int argc, char **argv) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }
  const std::string cmd = argv[1];
  std::vector<std::string> args(argv + 2, argv + argc);

  // Console logging until the settings name a level, so a bad settings file
  // is reported through an initialised logger.
  Logger::init(Logger::CONSOLE_ONLY_OUTPUT, LogLevel::WARN);
  Settings settings = loadSettings(settingsPath());
  applyEnvironmentOverrides(settings);

  {
    std::error_code ec;
    std::filesystem::create_directories(logsDir(), ec);
    if (ec) {
      std::cerr << "WARNING: cannot create " << logsDir() << ": " << ec.message()
                << ", logging to console" << std::endl;
      Logger::init(Logger::CONSOLE_ONLY_OUTPUT,
                   Logger::levelFromString(settings.logLevel));
    } else {
      Logger::init(logsDir() + "/site-blocker.log",
                   Logger::levelFromString(settings.logLevel));
    }
    Logger::getInstance().setComponent("site-blocker-cli");
  }

  PosixCommandRunner runner;
  SiteBlocker blocker(settings, configPath(),
                      AccessLogReader(accessLogPath(), legacyAccessLogPath()),
                      runner);

  try {
    if (cmd == "list") {
      printDomains(blocker.getDomains());
      return 0;
    }
    if (cmd == "add" || cmd == "remove") {
      if (args.empty()) {
        printUsage(argv[0]);
        return 1;
      }
      printDomains(cmd == "add" ? blocker.addDomains(args)
                                : blocker.removeDomains(args));
      return 0;
    }
    if (cmd == "status") {
      std::cout << (blocker.getStatus() ? "active" : "inactive") << std::endl;
      return 0;
    }
    if (cmd == "enable") {
      blocker.enableBlocking();
      std::cout << "Blocking enabled" << std::endl;
      return 0;
    }
    if (cmd == "disable") {
      blocker.disableBlocking();
      std::cout << "Blocking disabled" << std::endl;
      return 0;
    }
    if (cmd == "log") {
      std::optional<int> days;
      if (!args.empty()) {
        days = parseDayCount(args[0]);
        if (!days) {
          std::cerr << "Invalid number of days: " << args[0] << std::endl;
          return 1;
        }
      }
      for (const auto &entry : blocker.getAccessLog(days))
        std::cout << entry.ts << '\t' << entry.domain << std::endl;
      return 0;
    }
    if (cmd == "reconcile") {
      blocker.reconcileOnStartup();
      return 0;
    }
  } catch (const PrivilegedWriteError &e) {
    Logger::getInstance().log(LogLevel::ERROR,
                              cmd + " failed: " + e.what() + " " + e.output());
    std::cerr << "Error: " << e.what() << std::endl;
    if (!e.output().empty())
      std::cerr << e.output() << std::endl;
    return 1;
  } catch (const SiteBlockerError &e) {
    Logger::getInstance().log(LogLevel::ERROR, cmd + " failed: " + e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::FATAL,
                              "Unhandled exception in " + cmd + ": " + e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  printUsage(argv[0]);
  return 1;
}
