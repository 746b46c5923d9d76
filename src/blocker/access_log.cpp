#include "blocker/access_log.hpp"
#include "blocker/errors.hpp"
#include "utilities/logger.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace siteblocker {

namespace {

bool readDigits(const std::string &s, std::size_t &pos, std::size_t count,
                int &out) {
  if (pos + count > s.size())
    return false;
  int value = 0;
  for (std::size_t i = 0; i < count; ++i) {
    char ch = s[pos + i];
    if (!std::isdigit(static_cast<unsigned char>(ch)))
      return false;
    value = value * 10 + (ch - '0');
  }
  pos += count;
  out = value;
  return true;
}

bool expect(const std::string &s, std::size_t &pos, char ch) {
  if (pos >= s.size() || s[pos] != ch)
    return false;
  ++pos;
  return true;
}

std::string readFile(const std::string &path) {
  std::ifstream in(path);
  if (!in.is_open())
    throw LogParseError("unable to open " + path);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

// A record counts only if both fields are strings; anything else is dropped.
std::optional<AccessLogEntry> toEntry(const nlohmann::json &record) {
  if (!record.is_object())
    return std::nullopt;
  auto domain = record.find("domain");
  auto ts = record.find("ts");
  if (domain == record.end() || ts == record.end() || !domain->is_string() ||
      !ts->is_string())
    return std::nullopt;
  return AccessLogEntry{domain->get<std::string>(), ts->get<std::string>()};
}

} // namespace

std::optional<std::chrono::system_clock::time_point>
parseIsoTimestamp(const std::string &text) {
  std::size_t pos = 0;
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  long millis = 0;
  int offsetMinutes = 0;

  if (!readDigits(text, pos, 4, year) || !expect(text, pos, '-') ||
      !readDigits(text, pos, 2, month) || !expect(text, pos, '-') ||
      !readDigits(text, pos, 2, day))
    return std::nullopt;

  if (pos < text.size()) {
    if (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ')
      return std::nullopt;
    ++pos;
    if (!readDigits(text, pos, 2, hour) || !expect(text, pos, ':') ||
        !readDigits(text, pos, 2, minute))
      return std::nullopt;
    if (pos < text.size() && text[pos] == ':') {
      ++pos;
      if (!readDigits(text, pos, 2, second))
        return std::nullopt;
      if (pos < text.size() && text[pos] == '.') {
        ++pos;
        std::size_t start = pos;
        long scale = 100;
        while (pos < text.size() &&
               std::isdigit(static_cast<unsigned char>(text[pos]))) {
          millis += (text[pos] - '0') * scale;
          scale /= 10;
          ++pos;
        }
        if (pos == start)
          return std::nullopt;
      }
    }
    if (pos < text.size()) {
      char zone = text[pos];
      if (zone == 'Z' || zone == 'z') {
        ++pos;
      } else if (zone == '+' || zone == '-') {
        ++pos;
        int oh = 0, om = 0;
        if (!readDigits(text, pos, 2, oh))
          return std::nullopt;
        if (pos < text.size() && text[pos] == ':')
          ++pos;
        if (!readDigits(text, pos, 2, om) || oh > 23 || om > 59)
          return std::nullopt;
        offsetMinutes = (oh * 60 + om) * (zone == '-' ? -1 : 1);
      } else {
        return std::nullopt;
      }
    }
  }
  if (pos != text.size())
    return std::nullopt;
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 ||
      minute > 59 || second > 60)
    return std::nullopt;

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;
  std::time_t t = ::timegm(&tm);
  if (t == static_cast<std::time_t>(-1) && !(year == 1969 && month == 12))
    return std::nullopt;

  return std::chrono::system_clock::from_time_t(t) +
         std::chrono::milliseconds(millis) - std::chrono::minutes(offsetMinutes);
}

AccessLogReader::AccessLogReader(std::string jsonlPath, std::string legacyPath,
                                 Clock now)
    : jsonlPath_(std::move(jsonlPath)), legacyPath_(std::move(legacyPath)),
      now_(std::move(now)) {}

std::vector<AccessLogEntry>
AccessLogReader::parseJsonl(const std::string &path) const {
  const std::string raw = readFile(path);
  Logger::getInstance().log(LogLevel::DEBUG, "Access log " + path + ": " +
                                                 std::to_string(raw.size()) +
                                                 " bytes");
  std::vector<AccessLogEntry> entries;
  std::istringstream lines(raw);
  std::string line;
  while (std::getline(lines, line)) {
    if (line.find_first_not_of(" \t\r\n") == std::string::npos)
      continue;
    nlohmann::json record;
    try {
      record = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error &e) {
      throw LogParseError(path + ": " + e.what());
    }
    if (auto entry = toEntry(record))
      entries.push_back(std::move(*entry));
  }
  return entries;
}

std::vector<AccessLogEntry>
AccessLogReader::parseLegacy(const std::string &path) const {
  const std::string raw = readFile(path);
  Logger::getInstance().log(LogLevel::DEBUG, "Legacy access log " + path + ": " +
                                                 std::to_string(raw.size()) +
                                                 " bytes");
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(raw);
  } catch (const nlohmann::json::parse_error &e) {
    throw LogParseError(path + ": " + e.what());
  }
  std::vector<AccessLogEntry> entries;
  if (!doc.is_array())
    return entries;
  for (const auto &record : doc) {
    if (auto entry = toEntry(record))
      entries.push_back(std::move(*entry));
  }
  return entries;
}

namespace {

// now - days * 24h, clamped to the clock's range. The subtraction is done in
// whole seconds; converting a large day count straight to the clock's tick
// overflows.
std::chrono::system_clock::time_point
cutoffFor(std::chrono::system_clock::time_point now, int days) {
  using namespace std::chrono;
  using TimePoint = system_clock::time_point;

  const TimePoint nowSeconds = time_point_cast<seconds>(now);
  const long long base = duration_cast<seconds>(nowSeconds.time_since_epoch()).count();
  const long long lowest = duration_cast<seconds>(TimePoint::duration::min()).count();
  const long long highest = duration_cast<seconds>(TimePoint::duration::max()).count();
  const long long span = static_cast<long long>(days) * 86400;

  if (span > 0 && base - lowest <= span)
    return TimePoint::min();
  if (span < 0 && highest - base <= -span)
    return TimePoint::max();
  return TimePoint(duration_cast<TimePoint::duration>(seconds(base - span))) +
         (now - nowSeconds);
}

} // namespace

std::optional<int> parseDayCount(const std::string &text) {
  if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front())))
    return std::nullopt;
  std::size_t used = 0;
  int value = 0;
  try {
    value = std::stoi(text, &used);
  } catch (const std::logic_error &) {
    return std::nullopt;
  }
  if (used != text.size())
    return std::nullopt;
  return value;
}

std::vector<AccessLogEntry> AccessLogReader::read(std::optional<int> days) const {
  namespace fs = std::filesystem;
  using TimePoint = std::chrono::system_clock::time_point;

  std::error_code ec;
  const bool hasJsonl = fs::exists(jsonlPath_, ec);
  const bool hasLegacy = fs::exists(legacyPath_, ec);
  if (!hasJsonl && !hasLegacy)
    return {};

  std::vector<std::pair<std::optional<TimePoint>, AccessLogEntry>> timed;
  try {
    std::vector<AccessLogEntry> entries;
    if (hasJsonl)
      entries = parseJsonl(jsonlPath_);
    if (hasLegacy) {
      auto legacy = parseLegacy(legacyPath_);
      entries.insert(entries.end(), legacy.begin(), legacy.end());
    }
    timed.reserve(entries.size());
    for (auto &entry : entries) {
      auto when = parseIsoTimestamp(entry.ts);
      timed.emplace_back(when, std::move(entry));
    }
  } catch (const LogParseError &e) {
    Logger::getInstance().log(LogLevel::WARN,
                              std::string("Access log parse error: ") + e.what());
    return {};
  }

  // Unparsable timestamps sort as the epoch.
  std::stable_sort(timed.begin(), timed.end(), [](const auto &a, const auto &b) {
    return a.first.value_or(TimePoint{}) < b.first.value_or(TimePoint{});
  });

  std::optional<TimePoint> cutoff;
  if (days)
    cutoff = cutoffFor(now_(), *days);

  std::vector<AccessLogEntry> result;
  result.reserve(timed.size());
  for (auto &item : timed) {
    if (cutoff && (!item.first || *item.first < *cutoff))
      continue;
    result.push_back(std::move(item.second));
  }
  if (cutoff) {
    Logger::getInstance().log(LogLevel::DEBUG,
                              "Access log filtered to " +
                                  std::to_string(result.size()) + " entries for " +
                                  std::to_string(*days) + " day(s)");
  }
  return result;
}

} // namespace siteblocker
