#include "blocker/hosts_block.hpp"
#include "test_utils.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace hosts = siteblocker::hosts;

namespace {

std::string trimmed(const std::string &s) {
  auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos)
    return "";
  auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

} // namespace

TEST(HostsBuildContent, AddsBlockToCleanHosts) {
  std::string result = hosts::buildContent(kSampleHosts, {"facebook.com"});
  EXPECT_NE(result.find("# BEGIN SITE-BLOCKER"), std::string::npos);
  EXPECT_NE(result.find("127.0.0.1 facebook.com\n"), std::string::npos);
  EXPECT_NE(result.find("127.0.0.1 www.facebook.com\n"), std::string::npos);
  EXPECT_NE(result.find("# END SITE-BLOCKER"), std::string::npos);
  EXPECT_NE(result.find("127.0.0.1\tlocalhost"), std::string::npos);
  // One blank separator line and one trailing newline.
  EXPECT_NE(result.find("::1             localhost\n\n# BEGIN SITE-BLOCKER\n"),
            std::string::npos);
  EXPECT_EQ(result.substr(result.size() - 19), "# END SITE-BLOCKER\n");
}

TEST(HostsBuildContent, ReplacesExistingBlock) {
  std::string result = hosts::buildContent(kSampleHostsWithBlock, {"reddit.com"});
  EXPECT_EQ(result.find("facebook.com"), std::string::npos);
  EXPECT_NE(result.find("127.0.0.1 reddit.com"), std::string::npos);
  EXPECT_NE(result.find("127.0.0.1 www.reddit.com"), std::string::npos);
  EXPECT_EQ(countOccurrences(result, "# BEGIN SITE-BLOCKER"), 1);
}

TEST(HostsBuildContent, RepeatedApplicationKeepsOneBlock) {
  std::string content = kSampleHosts;
  for (int i = 0; i < 3; ++i)
    content = hosts::buildContent(content, {"a.com", "b.com"});
  EXPECT_EQ(countOccurrences(content, "# BEGIN SITE-BLOCKER"), 1);
  EXPECT_EQ(countOccurrences(content, "# END SITE-BLOCKER"), 1);
  EXPECT_EQ(content, hosts::buildContent(kSampleHosts, {"a.com", "b.com"}));
}

TEST(HostsBuildContent, EmptyDomainsEqualsStrip) {
  EXPECT_EQ(hosts::buildContent(kSampleHosts, {}), hosts::stripBlock(kSampleHosts));
  EXPECT_EQ(hosts::buildContent(kSampleHostsWithBlock, {}),
            hosts::stripBlock(kSampleHostsWithBlock));
  std::string result = hosts::buildContent(kSampleHosts, {});
  EXPECT_EQ(result.find("# BEGIN SITE-BLOCKER"), std::string::npos);
  EXPECT_EQ(trimmed(result), trimmed(kSampleHosts));
}

TEST(HostsBuildContent, ApexGetsTwoLines) {
  std::string result = hosts::buildContent(kSampleHosts, {"example.com"});
  EXPECT_EQ(countOccurrences(result, "\n127.0.0.1 "), 2);
  EXPECT_NE(result.find("127.0.0.1 example.com\n"), std::string::npos);
  EXPECT_NE(result.find("127.0.0.1 www.example.com\n"), std::string::npos);
  EXPECT_EQ(result.find("www.www."), std::string::npos);
}

TEST(HostsBuildContent, WwwDomainGetsOneLine) {
  std::string result = hosts::buildContent(kSampleHosts, {"www.example.com"});
  EXPECT_EQ(countOccurrences(result, "\n127.0.0.1 "), 1);
  EXPECT_NE(result.find("127.0.0.1 www.example.com\n"), std::string::npos);
  EXPECT_EQ(result.find("www.www."), std::string::npos);
}

TEST(HostsBuildContent, SortsDomains) {
  std::string result =
      hosts::buildContent(kSampleHosts, {"twitter.com", "facebook.com", "reddit.com"});
  const std::string expected = "# BEGIN SITE-BLOCKER\n"
                               "127.0.0.1 facebook.com\n"
                               "127.0.0.1 www.facebook.com\n"
                               "127.0.0.1 reddit.com\n"
                               "127.0.0.1 www.reddit.com\n"
                               "127.0.0.1 twitter.com\n"
                               "127.0.0.1 www.twitter.com\n"
                               "# END SITE-BLOCKER\n";
  EXPECT_NE(result.find(expected), std::string::npos);
  EXPECT_EQ(result, hosts::buildContent(kSampleHosts,
                                        {"reddit.com", "twitter.com", "facebook.com"}));
}

TEST(HostsStripBlock, RemovesBlock) {
  std::string result = hosts::stripBlock(kSampleHostsWithBlock);
  EXPECT_EQ(result.find("# BEGIN SITE-BLOCKER"), std::string::npos);
  EXPECT_EQ(result.find("facebook.com"), std::string::npos);
  EXPECT_NE(result.find("127.0.0.1\tlocalhost"), std::string::npos);
  EXPECT_EQ(result, kSampleHosts);
}

TEST(HostsStripBlock, NoOpOnCleanHosts) {
  EXPECT_EQ(hosts::stripBlock(kSampleHosts), kSampleHosts);
}

TEST(HostsStripBlock, CollapsesTrailingBlankLines) {
  EXPECT_EQ(hosts::stripBlock("127.0.0.1 localhost\n\n\n  \n"),
            "127.0.0.1 localhost\n");
  EXPECT_EQ(hosts::stripBlock("127.0.0.1 localhost"), "127.0.0.1 localhost\n");
}

TEST(HostsStripBlock, MatchesIndentedMarkers) {
  std::string content = "127.0.0.1 localhost\n"
                        "   # BEGIN SITE-BLOCKER  \n"
                        "127.0.0.1 a.com\n"
                        "\t# END SITE-BLOCKER\n";
  EXPECT_EQ(hosts::stripBlock(content), "127.0.0.1 localhost\n");
}

TEST(HostsStripBlock, RemovesEveryRegion) {
  std::string content = "127.0.0.1 localhost\n"
                        "# BEGIN SITE-BLOCKER\n127.0.0.1 a.com\n# END SITE-BLOCKER\n"
                        "10.0.0.1 keep.me\n"
                        "# BEGIN SITE-BLOCKER\n127.0.0.1 b.com\n# END SITE-BLOCKER\n";
  EXPECT_EQ(hosts::stripBlock(content), "127.0.0.1 localhost\n10.0.0.1 keep.me\n");
}

TEST(HostsStripBlock, BuildThenStripLeavesNoMarkers) {
  const std::vector<std::vector<std::string>> sets = {
      {}, {"a.com"}, {"www.b.com", "c.org"}, {"z.net", "y.net", "x.net"}};
  for (const auto &domains : sets) {
    std::string stripped =
        hosts::stripBlock(hosts::buildContent(kSampleHostsWithBlock, domains));
    EXPECT_EQ(stripped.find("# BEGIN SITE-BLOCKER"), std::string::npos);
    EXPECT_EQ(stripped.find("# END SITE-BLOCKER"), std::string::npos);
  }
}

TEST(HostsIsActive, DetectsActiveAndInactive) {
  EXPECT_TRUE(hosts::isActive(kSampleHostsWithBlock));
  EXPECT_FALSE(hosts::isActive(kSampleHosts));
}

TEST(HostsIsActive, PresenceOnlyIgnoresOrder) {
  EXPECT_TRUE(hosts::isActive("# END SITE-BLOCKER\n# BEGIN SITE-BLOCKER\n"));
  EXPECT_FALSE(hosts::isActive("# BEGIN SITE-BLOCKER\n127.0.0.1 a.com\n"));
}

TEST(HostsBlockedDomains, ListsNamesInsideBlock) {
  EXPECT_EQ(hosts::blockedDomains(kSampleHostsWithBlock),
            (std::vector<std::string>{"facebook.com", "www.facebook.com"}));
  EXPECT_TRUE(hosts::blockedDomains(kSampleHosts).empty());
}

TEST(HostsNeedsSync, DetectsStaleBlock) {
  std::string synced = hosts::buildContent(kSampleHosts, {"facebook.com"});
  EXPECT_FALSE(hosts::needsSync(synced, {"facebook.com"}));
  EXPECT_TRUE(hosts::needsSync(synced, {"facebook.com", "reddit.com"}));
  EXPECT_TRUE(hosts::needsSync(kSampleHosts, {"facebook.com"}));
  EXPECT_FALSE(hosts::needsSync(kSampleHosts, {}));
}
