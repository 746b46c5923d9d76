#ifndef SITEBLOCKER_ACCESS_LOG_HPP
#define SITEBLOCKER_ACCESS_LOG_HPP

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace siteblocker {

/**
 * @brief One attempt to reach a blocked domain, as recorded by the daemon.
 */
struct AccessLogEntry {
  std::string domain;
  std::string ts; ///< ISO-8601 timestamp exactly as written by the daemon.

  bool operator==(const AccessLogEntry &other) const {
    return domain == other.domain && ts == other.ts;
  }
};

/**
 * @brief Parse an ISO-8601 timestamp such as "2026-02-10T08:30:00.125Z".
 *
 * Accepts a date alone or a date-time with optional fractional seconds and
 * an optional "Z" or "+HH:MM" offset. A missing offset is read as UTC.
 */
std::optional<std::chrono::system_clock::time_point>
parseIsoTimestamp(const std::string &text);

/// Parse a non-negative day count; trailing characters or a sign are rejected.
std::optional<int> parseDayCount(const std::string &text);

/**
 * @brief Read-only view over the daemon's access logs.
 *
 * Two formats coexist: the current newline-delimited JSON log and a legacy
 * file holding a single JSON array. Both are read and merged; neither is
 * ever written here.
 */
class AccessLogReader {
public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  AccessLogReader(std::string jsonlPath, std::string legacyPath,
                  Clock now = [] { return std::chrono::system_clock::now(); });

  /**
   * @brief Merged entries sorted by time, oldest first.
   * @param days When set, drop entries older than now - days * 24h. A span
   *             reaching past the clock's range keeps every timed entry.
   * @return Empty if either file fails to parse; this never throws.
   */
  std::vector<AccessLogEntry> read(std::optional<int> days = std::nullopt) const;

private:
  std::vector<AccessLogEntry> parseJsonl(const std::string &path) const;
  std::vector<AccessLogEntry> parseLegacy(const std::string &path) const;

  std::string jsonlPath_;
  std::string legacyPath_;
  Clock now_;
};

} // namespace siteblocker

#endif // SITEBLOCKER_ACCESS_LOG_HPP
