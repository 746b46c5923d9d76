#pragma once
#ifndef SITEBLOCKER_LOGGER_H
#define SITEBLOCKER_LOGGER_H
#include <fstream>
#include <mutex>
#include <string>

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/**
 * @brief Process-wide JSON-lines logger with size based rotation.
 *
 * Every record is a single JSON object holding the timestamp, level,
 * component and message. Call Logger::init() once before use; calling it
 * again replaces the active instance.
 */
class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  static const std::string CONSOLE_ONLY_OUTPUT; // Special value for console-only logging
  static const std::string DEFAULT_COMPONENT;

  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);
  static Logger &getInstance();

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;
  void setComponent(const std::string &component);

  void log(LogLevel level, const std::string &message);

  /**
   * @brief Convenience wrapper for DEBUG level logging.
   *
   * Formats the provided printf-style string and logs it at DEBUG level.
   *
   * @param format printf-style format string.
   * @param ...    Format arguments.
   */
  static void debugf(const char *format, ...);

  static std::string levelToString(LogLevel level);
  static LogLevel levelFromString(const std::string &name,
                                  LogLevel fallback = LogLevel::INFO);

  ~Logger();

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSizeVal,
         int maxBackupFilesVal);
  std::string getTimestamp();
  void rotateIfNeeded();

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  std::string component;
  long long maxFileSize;
  int maxBackupFiles;

  static Logger *s_instance;
  static std::recursive_mutex s_mutex;
};

#endif // SITEBLOCKER_LOGGER_H
