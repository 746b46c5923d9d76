#include "utilities/settings.hpp"
#include "utilities/logger.h"

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace siteblocker {

namespace {

void readString(const YAML::Node &node, const char *key, std::string &out) {
  if (node[key])
    out = node[key].as<std::string>();
}

std::vector<std::string> splitWords(const std::string &text) {
  std::vector<std::string> words;
  std::istringstream in(text);
  std::string word;
  while (in >> word)
    words.push_back(word);
  return words;
}

} // namespace

Settings loadSettings(const std::string &path) {
  Settings settings;
  if (!std::filesystem::exists(path)) {
    return settings;
  }
  try {
    YAML::Node node = YAML::LoadFile(path);
    readString(node, "hosts_path", settings.hostsPath);
    readString(node, "backup_path", settings.backupPath);
    readString(node, "pid_file", settings.pidFile);
    readString(node, "logger_staging_path", settings.loggerStagingPath);
    readString(node, "resource_dir", settings.resourceDir);
    readString(node, "python_interpreter", settings.pythonInterpreter);
    readString(node, "flush_cache_command", settings.flushCacheCommand);
    readString(node, "restart_resolver_command",
               settings.restartResolverCommand);
    readString(node, "log_level", settings.logLevel);
    if (node["elevation_command"]) {
      const YAML::Node &elevation = node["elevation_command"];
      if (elevation.IsSequence())
        settings.elevationCommand = elevation.as<std::vector<std::string>>();
      else
        settings.elevationCommand = splitWords(elevation.as<std::string>());
    }
  } catch (const YAML::Exception &e) {
    Logger::getInstance().log(LogLevel::WARN, "Ignoring unreadable settings file " +
                                                  path + ": " + e.what());
    return Settings{};
  }
  return settings;
}

void applyEnvironmentOverrides(Settings &settings) {
  if (const char *env = std::getenv("SITEBLOCKER_HOSTS_PATH"))
    settings.hostsPath = env;
  if (const char *env = std::getenv("SITEBLOCKER_ELEVATION"))
    settings.elevationCommand = splitWords(env);
  if (const char *env = std::getenv("SITEBLOCKER_LOG_LEVEL"))
    settings.logLevel = env;
}

} // namespace siteblocker
