#pragma once

#include <string>

namespace siteblocker {

void setDataDir(const std::string &dir);
const std::string &getDataDir();

std::string logsDir();
std::string configPath();
std::string settingsPath();
std::string accessLogPath();
std::string legacyAccessLogPath();

} // namespace siteblocker
