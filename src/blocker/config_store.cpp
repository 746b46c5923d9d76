#include "blocker/config_store.hpp"
#include "blocker/domain.hpp"
#include "blocker/errors.hpp"
#include "utilities/file_lock.hpp"
#include "utilities/logger.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <system_error>
#include <utility>
#include <unistd.h>

namespace siteblocker {

namespace fs = std::filesystem;

namespace {

void ensureParentDir(const std::string &path) {
  fs::path parent = fs::path(path).parent_path();
  if (parent.empty())
    return;
  std::error_code ec;
  fs::create_directories(parent, ec);
  if (ec) {
    std::string msg = "Unable to create config directory " + parent.string() +
                      ": " + ec.message();
    Logger::getInstance().log(LogLevel::ERROR, msg);
    throw ConfigWriteError(msg);
  }
}

std::vector<std::string> normalizeAll(const std::vector<std::string> &raw) {
  std::vector<std::string> out;
  out.reserve(raw.size());
  for (const auto &d : raw)
    out.push_back(normalizeDomain(d));
  return out;
}

bool contains(const std::vector<std::string> &values, const std::string &v) {
  return std::find(values.begin(), values.end(), v) != values.end();
}

} // namespace

ConfigStore::ConfigStore(std::string path) : path_(std::move(path)) {}

Config ConfigStore::load() const {
  ensureParentDir(path_);
  ScopedFileLock lock(lockPath());
  return loadUnlocked();
}

Config ConfigStore::loadUnlocked() const {
  if (!fs::exists(path_)) {
    Config defaults;
    Logger::getInstance().log(LogLevel::INFO,
                              "Creating default config at " + path_);
    save(defaults);
    return defaults;
  }

  std::ifstream in(path_);
  if (!in.is_open()) {
    std::string msg = "Unable to open config file " + path_;
    Logger::getInstance().log(LogLevel::ERROR, msg);
    throw ConfigReadError(msg);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(buffer.str());
  } catch (const nlohmann::json::parse_error &e) {
    std::string msg = "Malformed config file " + path_ + ": " + e.what();
    Logger::getInstance().log(LogLevel::ERROR, msg);
    throw ConfigReadError(msg);
  }

  if (!doc.is_object()) {
    std::string msg = "Config file " + path_ + " is not a JSON object";
    Logger::getInstance().log(LogLevel::ERROR, msg);
    throw ConfigReadError(msg);
  }

  Config config;
  if (doc.contains("domains")) {
    const auto &domains = doc["domains"];
    if (!domains.is_array()) {
      std::string msg = "Config file " + path_ + ": \"domains\" is not an array";
      Logger::getInstance().log(LogLevel::ERROR, msg);
      throw ConfigReadError(msg);
    }
    for (const auto &entry : domains) {
      if (!entry.is_string()) {
        std::string msg =
            "Config file " + path_ + ": non-string entry in \"domains\"";
        Logger::getInstance().log(LogLevel::ERROR, msg);
        throw ConfigReadError(msg);
      }
      std::string domain = entry.get<std::string>();
      if (!contains(config.domains, domain))
        config.domains.push_back(domain);
    }
  }
  // Configs written before the flag existed have no "enabled" key.
  auto enabled = doc.find("enabled");
  config.enabled = enabled != doc.end() && enabled->is_boolean() &&
                   enabled->get<bool>();
  return config;
}

void ConfigStore::save(const Config &config) const {
  ensureParentDir(path_);

  nlohmann::ordered_json doc;
  doc["domains"] = config.domains;
  doc["enabled"] = config.enabled;

  std::string tmpPath = path_ + ".tmp." + std::to_string(::getpid());
  {
    std::ofstream out(tmpPath, std::ios::trunc);
    if (!out.is_open()) {
      std::string msg = "Unable to write config file " + tmpPath;
      Logger::getInstance().log(LogLevel::ERROR, msg);
      throw ConfigWriteError(msg);
    }
    out << doc.dump(2) << "\n";
    out.flush();
    if (!out) {
      std::error_code ignored;
      fs::remove(tmpPath, ignored);
      std::string msg = "Short write to config file " + tmpPath;
      Logger::getInstance().log(LogLevel::ERROR, msg);
      throw ConfigWriteError(msg);
    }
  }

  std::error_code ec;
  fs::rename(tmpPath, path_, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmpPath, ignored);
    std::string msg = "Unable to replace config file " + path_ + ": " + ec.message();
    Logger::getInstance().log(LogLevel::ERROR, msg);
    throw ConfigWriteError(msg);
  }
}

std::vector<std::string>
ConfigStore::add(const std::vector<std::string> &domains) const {
  std::vector<std::string> normalized = normalizeAll(domains);

  ensureParentDir(path_);
  ScopedFileLock lock(lockPath());
  Config config = loadUnlocked();
  std::vector<std::string> added;
  for (const auto &d : normalized) {
    if (!contains(config.domains, d)) {
      config.domains.push_back(d);
      added.push_back(d);
    }
  }
  if (!added.empty()) {
    save(config);
    Logger::getInstance().log(LogLevel::INFO, "Added " + std::to_string(added.size()) +
                                                  " domain(s) to " + path_);
  }
  return added;
}

std::vector<std::string>
ConfigStore::remove(const std::vector<std::string> &domains) const {
  std::vector<std::string> normalized = normalizeAll(domains);

  ensureParentDir(path_);
  ScopedFileLock lock(lockPath());
  Config config = loadUnlocked();
  std::vector<std::string> removed;
  for (const auto &d : normalized) {
    auto it = std::find(config.domains.begin(), config.domains.end(), d);
    if (it != config.domains.end()) {
      config.domains.erase(it);
      removed.push_back(d);
    }
  }
  if (!removed.empty()) {
    save(config);
    Logger::getInstance().log(LogLevel::INFO, "Removed " +
                                                  std::to_string(removed.size()) +
                                                  " domain(s) from " + path_);
  }
  return removed;
}

void ConfigStore::setEnabled(bool enabled) const {
  ensureParentDir(path_);
  ScopedFileLock lock(lockPath());
  Config config = loadUnlocked();
  config.enabled = enabled;
  save(config);
}

} // namespace siteblocker
