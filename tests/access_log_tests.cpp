#include "blocker/access_log.hpp"
#include "test_utils.hpp"

#include <chrono>
#include <climits>
#include <gtest/gtest.h>
#include <stdexcept>

using siteblocker::AccessLogEntry;
using siteblocker::AccessLogReader;
using siteblocker::parseDayCount;
using siteblocker::parseIsoTimestamp;

namespace {

std::chrono::system_clock::time_point at(const std::string &iso) {
  auto parsed = parseIsoTimestamp(iso);
  if (!parsed)
    throw std::invalid_argument("bad fixture timestamp " + iso);
  return *parsed;
}

std::vector<std::string> domainsOf(const std::vector<AccessLogEntry> &entries) {
  std::vector<std::string> out;
  for (const auto &e : entries)
    out.push_back(e.domain);
  return out;
}

} // namespace

class AccessLogTest : public ::testing::Test {
protected:
  AccessLogReader reader(const std::string &now = "2026-02-10T12:00:00Z") const {
    auto fixed = at(now);
    return AccessLogReader(jsonl(), legacy(), [fixed] { return fixed; });
  }
  std::string jsonl() const { return dir.file("access_log.jsonl"); }
  std::string legacy() const { return dir.file("access_log.json"); }

  TempDir dir;
};

TEST(ParseIsoTimestamp, AcceptsCommonForms) {
  const auto base = at("2026-02-10T08:30:00Z");
  EXPECT_EQ(at("2026-02-10T08:30:00"), base);
  EXPECT_EQ(at("2026-02-10 08:30:00Z"), base);
  EXPECT_EQ(at("2026-02-10T08:30Z"), base);
  EXPECT_EQ(at("2026-02-10T10:30:00+02:00"), base);
  EXPECT_EQ(at("2026-02-10T03:30:00-0500"), base);
  EXPECT_EQ(at("2026-02-10T08:30:00.250Z") - base, std::chrono::milliseconds(250));
  EXPECT_EQ(at("2026-02-10"), at("2026-02-10T00:00:00Z"));
  EXPECT_EQ(std::chrono::system_clock::to_time_t(at("1970-01-02T00:00:00Z")), 86400);
}

TEST(ParseIsoTimestamp, RejectsMalformed) {
  for (const char *text : {"", "yesterday", "2026-2-10", "2026-02-10T8:30",
                           "2026-13-01T00:00:00Z", "2026-02-10T24:00:00Z",
                           "2026-02-10T08:30:00+25:00", "2026-02-10T08:30:00Q",
                           "2026-02-10T08:30:00.Z", "2026-02-10T08:30:00Z junk"}) {
    EXPECT_FALSE(parseIsoTimestamp(text).has_value()) << text;
  }
}

TEST_F(AccessLogTest, NoFilesGivesEmpty) {
  EXPECT_TRUE(reader().read().empty());
}

TEST_F(AccessLogTest, ReadsJsonlSkippingBlankLines) {
  writeFileContents(jsonl(), "{\"domain\":\"facebook.com\",\"ts\":\"2026-02-10T08:00:00Z\"}\n"
                             "\n"
                             "   \n"
                             "{\"domain\":\"reddit.com\",\"ts\":\"2026-02-10T09:00:00Z\"}\n");
  auto entries = reader().read();
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0], (AccessLogEntry{"facebook.com", "2026-02-10T08:00:00Z"}));
  EXPECT_EQ(entries[1].domain, "reddit.com");
}

TEST_F(AccessLogTest, MergesLegacyAndJsonlInTimeOrder) {
  writeFileContents(jsonl(), "{\"domain\":\"c.com\",\"ts\":\"2026-02-10T11:00:00Z\"}\n"
                             "{\"domain\":\"a.com\",\"ts\":\"2026-02-10T07:00:00Z\"}\n");
  writeFileContents(legacy(), R"([
    {"domain": "b.com", "ts": "2026-02-10T09:00:00Z"},
    {"domain": "old.com", "ts": "2026-01-01T00:00:00Z"}
  ])");
  EXPECT_EQ(domainsOf(reader().read()),
            (std::vector<std::string>{"old.com", "a.com", "b.com", "c.com"}));
}

TEST_F(AccessLogTest, SortsMixedOffsetsByInstant) {
  writeFileContents(jsonl(), "{\"domain\":\"later.com\",\"ts\":\"2026-02-10T09:00:00+00:00\"}\n"
                             "{\"domain\":\"earlier.com\",\"ts\":\"2026-02-10T10:00:00+02:00\"}\n");
  EXPECT_EQ(domainsOf(reader().read()),
            (std::vector<std::string>{"earlier.com", "later.com"}));
}

TEST_F(AccessLogTest, DaysFilterKeepsRecentEntries) {
  writeFileContents(jsonl(), "{\"domain\":\"week.com\",\"ts\":\"2026-02-03T12:00:00Z\"}\n"
                             "{\"domain\":\"hours.com\",\"ts\":\"2026-02-10T06:00:00Z\"}\n"
                             "{\"domain\":\"edge.com\",\"ts\":\"2026-02-09T12:00:00Z\"}\n"
                             "{\"domain\":\"bad.com\",\"ts\":\"not a time\"}\n");
  auto r = reader("2026-02-10T12:00:00Z");
  EXPECT_EQ(domainsOf(r.read(1)), (std::vector<std::string>{"edge.com", "hours.com"}));
  EXPECT_EQ(domainsOf(r.read(7)),
            (std::vector<std::string>{"week.com", "edge.com", "hours.com"}));
  EXPECT_EQ(r.read().size(), 4u);
  EXPECT_EQ(r.read().front().domain, "bad.com");
}

TEST_F(AccessLogTest, InvalidRecordsAreDropped) {
  writeFileContents(jsonl(), "{\"domain\":\"ok.com\",\"ts\":\"2026-02-10T08:00:00Z\"}\n"
                             "[1,2,3]\n"
                             "{\"domain\":42,\"ts\":\"2026-02-10T08:00:00Z\"}\n"
                             "{\"ts\":\"2026-02-10T08:00:00Z\"}\n"
                             "\"just a string\"\n");
  writeFileContents(legacy(), R"([{"domain": "legacy.com"}, 7, {"domain": "x.com", "ts": null}])");
  EXPECT_EQ(domainsOf(reader().read()), std::vector<std::string>{"ok.com"});
}

TEST_F(AccessLogTest, MalformedJsonlLineGivesEmpty) {
  writeFileContents(jsonl(), "{\"domain\":\"ok.com\",\"ts\":\"2026-02-10T08:00:00Z\"}\n"
                             "{\"domain\": truncated\n");
  EXPECT_TRUE(reader().read().empty());
}

TEST_F(AccessLogTest, MalformedLegacyFileGivesEmpty) {
  writeFileContents(jsonl(), "{\"domain\":\"ok.com\",\"ts\":\"2026-02-10T08:00:00Z\"}\n");
  writeFileContents(legacy(), "[{\"domain\": ");
  EXPECT_TRUE(reader().read().empty());
}

TEST_F(AccessLogTest, NonArrayLegacyFileContributesNothing) {
  writeFileContents(jsonl(), "{\"domain\":\"ok.com\",\"ts\":\"2026-02-10T08:00:00Z\"}\n");
  writeFileContents(legacy(), "{\"domain\":\"x.com\",\"ts\":\"2026-02-10T08:00:00Z\"}");
  EXPECT_EQ(domainsOf(reader().read()), std::vector<std::string>{"ok.com"});
}

TEST_F(AccessLogTest, ReadingDoesNotModifyFiles) {
  const std::string content = "{\"domain\":\"ok.com\",\"ts\":\"2026-02-10T08:00:00Z\"}\n";
  writeFileContents(jsonl(), content);
  reader().read(3);
  EXPECT_EQ(readFileContents(jsonl()), content);
}

TEST_F(AccessLogTest, HugeDayCountKeepsEveryTimedEntry) {
  writeFileContents(jsonl(), "{\"domain\":\"epoch.com\",\"ts\":\"1970-01-01T00:00:00Z\"}\n"
                             "{\"domain\":\"recent.com\",\"ts\":\"2026-02-10T06:00:00Z\"}\n"
                             "{\"domain\":\"bad.com\",\"ts\":\"not a time\"}\n");
  auto r = reader("2026-02-10T12:00:00Z");
  const std::vector<std::string> timed{"epoch.com", "recent.com"};
  EXPECT_EQ(domainsOf(r.read(100000)), timed);
  EXPECT_EQ(domainsOf(r.read(200000)), timed);
  EXPECT_EQ(domainsOf(r.read(INT_MAX)), timed);
  EXPECT_EQ(domainsOf(r.read(0)), std::vector<std::string>{});
}

TEST(ParseDayCount, AcceptsOnlyWholeNonNegativeNumbers) {
  EXPECT_EQ(parseDayCount("0").value_or(-1), 0);
  EXPECT_EQ(parseDayCount("7").value_or(-1), 7);
  EXPECT_EQ(parseDayCount("200000").value_or(-1), 200000);
  for (const char *text : {"", "5abc", "abc", "-1", "+3", " 4", "4 ", "1.5",
                           "99999999999999999999"}) {
    EXPECT_FALSE(parseDayCount(text).has_value()) << text;
  }
}
