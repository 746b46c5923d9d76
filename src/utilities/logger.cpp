#include "utilities/logger.h"
#include <algorithm>
#include <cctype>
#include <cstdarg> // For va_list, va_start, va_end
#include <cstdio>  // For std::rename and std::remove
#include <ctime>
#include <iostream>
#include <nlohmann/json.hpp>

Logger *Logger::s_instance = nullptr;
std::recursive_mutex Logger::s_mutex;
const std::string Logger::CONSOLE_ONLY_OUTPUT = "::CONSOLE::";
const std::string Logger::DEFAULT_COMPONENT = "site-blocker";

void Logger::init(const std::string &logFile, LogLevel level,
                  long long maxFileSizeVal, int maxBackupFilesVal) {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  delete s_instance;
  s_instance = nullptr;
  s_instance = new Logger(logFile, level, maxFileSizeVal, maxBackupFilesVal);
}

Logger &Logger::getInstance() {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  if (!s_instance) {
    // Nobody called init(); fall back to console output so callers never
    // dereference a null instance.
    std::cerr << "WARNING: Logger::getInstance() called before Logger::init(), "
                 "logging WARN and above to the console."
              << std::endl;
    Logger::init(Logger::CONSOLE_ONLY_OUTPUT, LogLevel::WARN);
  }
  return *s_instance;
}

Logger::Logger(const std::string &logFile, LogLevel level,
               long long maxFileSizeVal, int maxBackupFilesVal)
    : currentLogLevel(level), logFilePath(logFile),
      component(DEFAULT_COMPONENT), maxFileSize(maxFileSizeVal),
      maxBackupFiles(maxBackupFilesVal) {
  if (logFile != CONSOLE_ONLY_OUTPUT) {
    logFileStream.open(logFilePath, std::ios::app);
    if (!logFileStream.is_open()) {
      std::cerr << "Error: Could not open log file: " << logFilePath
                << std::endl;
    }
  }
}

Logger::~Logger() {
  if (logFileStream.is_open()) {
    logFileStream.close();
  }
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  currentLogLevel = level;
}

LogLevel Logger::getLogLevel() const {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  return currentLogLevel;
}

void Logger::setComponent(const std::string &name) {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  component = name;
}

std::string Logger::levelToString(LogLevel level) {
  switch (level) {
  case TRACE:
    return "TRACE";
  case DEBUG:
    return "DEBUG";
  case INFO:
    return "INFO";
  case WARN:
    return "WARN";
  case ERROR:
    return "ERROR";
  case FATAL:
    return "FATAL";
  default:
    return "UNKNOWN";
  }
}

LogLevel Logger::levelFromString(const std::string &name, LogLevel fallback) {
  std::string upper(name);
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  if (upper == "TRACE")
    return TRACE;
  if (upper == "DEBUG")
    return DEBUG;
  if (upper == "INFO")
    return INFO;
  if (upper == "WARN" || upper == "WARNING")
    return WARN;
  if (upper == "ERROR")
    return ERROR;
  if (upper == "FATAL")
    return FATAL;
  return fallback;
}

void Logger::rotateIfNeeded() {
  if (!logFileStream.is_open() || maxFileSize <= 0) {
    return;
  }
  logFileStream.clear();
  logFileStream.flush();
  if (logFileStream.tellp() < maxFileSize) {
    return;
  }
  logFileStream.close();

  if (maxBackupFiles == 0) {
    std::remove(logFilePath.c_str());
  } else {
    // The oldest backup falls off the end; the rest shift up by one.
    std::string oldestPath = logFilePath + "." + std::to_string(maxBackupFiles);
    std::remove(oldestPath.c_str());

    for (int i = maxBackupFiles - 1; i >= 1; --i) {
      std::string oldPath = logFilePath + "." + std::to_string(i);
      std::string newPath = logFilePath + "." + std::to_string(i + 1);
      std::ifstream oldFileTest(oldPath.c_str());
      if (oldFileTest.good()) {
        oldFileTest.close();
        std::rename(oldPath.c_str(), newPath.c_str());
      }
    }
    std::rename(logFilePath.c_str(), (logFilePath + ".1").c_str());
  }

  logFileStream.open(logFilePath, std::ios::app);
  if (!logFileStream.is_open()) {
    std::cerr << "Error: Could not re-open log file after rotation: "
              << logFilePath << std::endl;
  }
}

void Logger::log(LogLevel level, const std::string &message) {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  if (level < currentLogLevel) {
    return;
  }

  nlohmann::ordered_json record;
  record["timestamp"] = getTimestamp();
  record["level"] = levelToString(level);
  record["component"] = component;
  record["message"] = message;
  // Invalid UTF-8 in a message must not take the caller down with it.
  const std::string jsonLine =
      record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

  if (logFilePath == CONSOLE_ONLY_OUTPUT) {
    std::cout << jsonLine << std::endl;
    return;
  }

  rotateIfNeeded();
  if (logFileStream.is_open()) {
    logFileStream << jsonLine << std::endl;
  }
}

void Logger::debugf(const char *format, ...) {
  char buffer[512];
  va_list args;
  va_start(args, format);
  vsnprintf(buffer, sizeof(buffer), format, args);
  va_end(args);
  Logger::getInstance().log(LogLevel::DEBUG, buffer);
}

std::string Logger::getTimestamp() {
  std::time_t currentTime = std::time(nullptr);
  std::tm localTime{};
  localtime_r(&currentTime, &localTime);
  char timestamp[20];
  std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &localTime);
  return std::string(timestamp);
}
