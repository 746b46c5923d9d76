#include "blocker/logger_supervisor.hpp"
#include "blocker/errors.hpp"
#include "utilities/logger.h"

#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <pwd.h>
#include <sstream>
#include <system_error>
#include <unistd.h>
#include <utility>

namespace siteblocker {

namespace fs = std::filesystem;

namespace {

const char *const kLoggerScriptName = "access_logger.py";

std::string executableDir() {
  std::error_code ec;
  fs::path exe = fs::read_symlink("/proc/self/exe", ec);
  if (ec)
    return fs::current_path(ec).string();
  return exe.parent_path().string();
}

} // namespace

LoggerDaemonSupervisor::LoggerDaemonSupervisor(const Settings &settings,
                                               CommandRunner &runner,
                                               SignalProbe probe)
    : settings_(settings), runner_(runner), probe_(std::move(probe)) {}

LoggerDaemonSupervisor::SignalProbe LoggerDaemonSupervisor::defaultProbe() {
  return [](pid_t pid) { return ::kill(pid, 0) == 0 ? 0 : errno; };
}

std::optional<pid_t> LoggerDaemonSupervisor::parsePid(const std::string &text) {
  auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos)
    return std::nullopt;
  auto end = text.find_last_not_of(" \t\r\n");
  const std::string digits = text.substr(begin, end - begin + 1);

  // Only plain decimal digits: no sign, fraction, exponent, NaN or Infinity.
  for (char ch : digits) {
    if (!std::isdigit(static_cast<unsigned char>(ch)))
      return std::nullopt;
  }
  if (digits.size() > 10)
    return std::nullopt;
  long long value = std::stoll(digits);
  if (value <= 0 || value > std::numeric_limits<pid_t>::max())
    return std::nullopt;
  return static_cast<pid_t>(value);
}

bool LoggerDaemonSupervisor::isProcessAlive(pid_t pid) const {
  if (pid <= 0)
    return false;
  int err = probe_(pid);
  return err == 0 || err == EPERM;
}

bool LoggerDaemonSupervisor::isRunning() const {
  std::ifstream in(settings_.pidFile);
  if (!in.is_open()) {
    Logger::getInstance().log(LogLevel::DEBUG, "Logger daemon: no pid file");
    return false;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  auto pid = parsePid(buffer.str());
  if (!pid) {
    Logger::getInstance().log(LogLevel::DEBUG,
                              "Logger daemon: invalid pid file " + settings_.pidFile);
    return false;
  }
  if (!isProcessAlive(*pid)) {
    Logger::getInstance().log(LogLevel::DEBUG,
                              "Logger daemon: pid " + std::to_string(*pid) +
                                  " is not running");
    return false;
  }
  Logger::getInstance().log(LogLevel::DEBUG,
                            "Logger daemon: running, pid " + std::to_string(*pid));
  return true;
}

std::vector<std::string> LoggerDaemonSupervisor::candidateScriptPaths() const {
  return {
      (fs::path(settings_.resourceDir) / kLoggerScriptName).string(),
      (fs::path(executableDir()) / ".." / ".." / kLoggerScriptName)
          .lexically_normal()
          .string(),
  };
}

std::optional<std::string> LoggerDaemonSupervisor::resolveLoggerScript() const {
  std::optional<std::string> source;
  for (const auto &candidate : candidateScriptPaths()) {
    if (fs::is_regular_file(candidate)) {
      source = candidate;
      break;
    }
  }
  if (!source) {
    Logger::getInstance().log(LogLevel::WARN,
                              "Logger script " + std::string(kLoggerScriptName) +
                                  " not found");
    return std::nullopt;
  }

  const std::string &staged = settings_.loggerStagingPath;
  std::error_code ec;
  fs::copy_file(*source, staged, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    Logger::getInstance().log(LogLevel::WARN, "Unable to stage logger script " +
                                                  *source + " -> " + staged +
                                                  ": " + ec.message());
    return std::nullopt;
  }
  fs::permissions(staged,
                  fs::perms::owner_read | fs::perms::owner_write |
                      fs::perms::group_read | fs::perms::others_read,
                  fs::perm_options::replace, ec);
  if (ec) {
    Logger::getInstance().log(LogLevel::WARN, "Unable to chmod staged logger script " +
                                                  staged + ": " + ec.message());
  }
  Logger::getInstance().log(LogLevel::DEBUG,
                            "Logger script " + *source + " staged at " + staged);
  return staged;
}

std::string LoggerDaemonSupervisor::realUser() {
  if (const char *sudoUser = std::getenv("SUDO_USER")) {
    if (sudoUser[0] != '\0')
      return sudoUser;
  }
  if (const char *user = std::getenv("USER")) {
    if (user[0] != '\0')
      return user;
  }
  if (struct passwd *pw = ::getpwuid(::getuid()))
    return pw->pw_name;
  return {};
}

std::string LoggerDaemonSupervisor::startCommand(const std::string &script,
                                                 const std::string &user) const {
  // The daemon derives its log directory from SUDO_USER.
  return "SUDO_USER=" + shellQuote(user) + " " +
         shellQuote(settings_.pythonInterpreter) + " " + shellQuote(script) +
         " start";
}

std::string LoggerDaemonSupervisor::stopCommand(const std::string &script) const {
  return shellQuote(settings_.pythonInterpreter) + " " + shellQuote(script) +
         " stop";
}

void LoggerDaemonSupervisor::start() {
  auto script = resolveLoggerScript();
  if (!script)
    throw LoggerStartError("logger script not found");

  const std::string command = startCommand(*script, realUser());
  Logger::getInstance().log(LogLevel::INFO, "Starting logger daemon: " + command);
  CommandResult result =
      runner_.run(shellScriptArgv(settings_.elevationCommand, command));
  if (!result.spawned || result.exitCode != 0) {
    throw LoggerStartError("logger start exited with " +
                           std::to_string(result.exitCode) + ": " + result.output);
  }
}

void LoggerDaemonSupervisor::ensureRunning() {
  if (isRunning()) {
    Logger::getInstance().log(LogLevel::DEBUG, "Logger daemon already running");
    return;
  }
  try {
    start();
  } catch (const LoggerStartError &e) {
    Logger::getInstance().log(LogLevel::WARN,
                              std::string("Logger daemon not started: ") + e.what());
  }
}

} // namespace siteblocker
