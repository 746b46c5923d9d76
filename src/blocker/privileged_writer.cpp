#include "blocker/privileged_writer.hpp"
#include "blocker/errors.hpp"
#include "blocker/hosts_block.hpp"
#include "utilities/logger.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace siteblocker {

namespace {

/**
 * Private mkstemp file that is unlinked when the object goes out of scope,
 * whichever way apply() exits.
 */
class TemporaryFile {
public:
  explicit TemporaryFile(const std::string &content) {
    std::string pattern =
        (std::filesystem::temp_directory_path() / "site-blocker-hosts-XXXXXX")
            .string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    int fd = ::mkstemp(buffer.data());
    if (fd < 0) {
      throw PrivilegedWriteError(std::string("Unable to create temporary file: ") +
                                     std::strerror(errno),
                                 -1, "");
    }
    path_.assign(buffer.data());

    std::size_t written = 0;
    while (written < content.size()) {
      ssize_t n = ::write(fd, content.data() + written, content.size() - written);
      if (n < 0) {
        if (errno == EINTR)
          continue;
        int err = errno;
        ::close(fd);
        ::unlink(path_.c_str());
        throw PrivilegedWriteError(std::string("Unable to write temporary file: ") +
                                       std::strerror(err),
                                   -1, "");
      }
      written += static_cast<std::size_t>(n);
    }
    if (::close(fd) != 0) {
      int err = errno;
      ::unlink(path_.c_str());
      throw PrivilegedWriteError(std::string("Unable to close temporary file: ") +
                                     std::strerror(err),
                                 -1, "");
    }
  }

  ~TemporaryFile() {
    if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
      Logger::getInstance().log(LogLevel::WARN,
                                "Unable to remove temporary file " + path_);
    }
  }

  TemporaryFile(const TemporaryFile &) = delete;
  TemporaryFile &operator=(const TemporaryFile &) = delete;

  const std::string &path() const { return path_; }

private:
  std::string path_;
};

} // namespace

PrivilegedWriter::PrivilegedWriter(const Settings &settings,
                                   CommandRunner &runner,
                                   LoggerDaemonSupervisor &supervisor)
    : settings_(settings), runner_(runner), supervisor_(supervisor) {}

std::string PrivilegedWriter::readHosts() const {
  std::ifstream in(settings_.hostsPath);
  if (!in.is_open()) {
    std::string msg = "Unable to read " + settings_.hostsPath;
    Logger::getInstance().log(LogLevel::ERROR, msg);
    throw SafetyCheckError(msg);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

void PrivilegedWriter::checkHostsContent(const std::string &content) {
  if (content.find(hosts::kLoopback) == std::string::npos ||
      content.find("localhost") == std::string::npos) {
    std::string msg = "hosts file is missing 127.0.0.1 localhost, aborting";
    Logger::getInstance().log(LogLevel::ERROR, msg);
    throw SafetyCheckError(msg);
  }
}

std::vector<PrivilegedStep>
PrivilegedWriter::planSteps(const std::vector<std::string> &domains,
                            const std::string &stagedPath,
                            const std::optional<std::string> &loggerScript) const {
  const std::string hostsPath = shellQuote(settings_.hostsPath);
  std::vector<PrivilegedStep> steps;

  if (domains.empty() && loggerScript)
    steps.push_back({supervisor_.stopCommand(*loggerScript), false});

  steps.push_back({"cp " + hostsPath + " " + shellQuote(settings_.backupPath), true});
  steps.push_back({"cp " + shellQuote(stagedPath) + " " + hostsPath, true});
  steps.push_back({"chmod 644 " + hostsPath, true});
  if (!settings_.flushCacheCommand.empty())
    steps.push_back({settings_.flushCacheCommand, false});
  if (!settings_.restartResolverCommand.empty())
    steps.push_back({settings_.restartResolverCommand, false});

  if (!domains.empty() && loggerScript) {
    steps.push_back(
        {supervisor_.startCommand(*loggerScript, LoggerDaemonSupervisor::realUser()),
         false});
  }
  return steps;
}

std::string PrivilegedWriter::composeScript(const std::vector<PrivilegedStep> &steps) {
  // && and || share precedence in sh, so the guard stays inside the braces
  // to keep it from absorbing an earlier required failure.
  std::string script;
  for (const auto &step : steps) {
    if (!script.empty())
      script += " && ";
    if (step.required)
      script += step.command;
    else
      script += "{ " + step.command + " || true ; }";
  }
  return script;
}

void PrivilegedWriter::apply(const std::vector<std::string> &domains) {
  Logger::getInstance().log(LogLevel::INFO, "Applying hosts block for " +
                                                std::to_string(domains.size()) +
                                                " domain(s)");
  const std::string current = readHosts();
  checkHostsContent(current);

  const std::string updated = hosts::buildContent(current, domains);
  TemporaryFile staged(updated);

  const std::optional<std::string> loggerScript = supervisor_.resolveLoggerScript();
  const std::string script =
      composeScript(planSteps(domains, staged.path(), loggerScript));
  Logger::getInstance().log(LogLevel::DEBUG, "Privileged script: " + script);

  CommandResult result =
      runner_.run(shellScriptArgv(settings_.elevationCommand, script));
  if (!result.spawned) {
    std::string msg = "Unable to launch privileged helper: " + result.output;
    Logger::getInstance().log(LogLevel::ERROR, msg);
    throw PrivilegedWriteError(msg, result.exitCode, result.output);
  }
  if (result.exitCode != 0) {
    // pkexec reports a dismissed or refused prompt as 126/127.
    std::string msg =
        (!settings_.elevationCommand.empty() &&
         (result.exitCode == 126 || result.exitCode == 127))
            ? "Authorization was cancelled or denied"
            : "Privileged hosts update failed with exit code " +
                  std::to_string(result.exitCode);
    Logger::getInstance().log(LogLevel::ERROR, msg + ": " + result.output);
    throw PrivilegedWriteError(msg, result.exitCode, result.output);
  }
  Logger::getInstance().log(LogLevel::INFO, "Hosts file updated: " + settings_.hostsPath);
}

} // namespace siteblocker
