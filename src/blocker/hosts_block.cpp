#include "blocker/hosts_block.hpp"

#include <algorithm>
#include <sstream>

namespace siteblocker {
namespace hosts {

namespace {

const char *const kWhitespace = " \t\r\n\f\v";

std::string trimCopy(const std::string &value) {
  auto begin = value.find_first_not_of(kWhitespace);
  if (begin == std::string::npos)
    return {};
  auto end = value.find_last_not_of(kWhitespace);
  return value.substr(begin, end - begin + 1);
}

std::string trimEndCopy(const std::string &value) {
  auto end = value.find_last_not_of(kWhitespace);
  if (end == std::string::npos)
    return {};
  return value.substr(0, end + 1);
}

// Splits on '\n' only; a trailing newline yields a final empty element.
std::vector<std::string> splitLines(const std::string &content) {
  std::vector<std::string> lines;
  std::string::size_type start = 0;
  for (;;) {
    auto nl = content.find('\n', start);
    if (nl == std::string::npos) {
      lines.push_back(content.substr(start));
      break;
    }
    lines.push_back(content.substr(start, nl - start));
    start = nl + 1;
  }
  return lines;
}

} // namespace

std::string stripBlock(const std::string &content) {
  std::vector<std::string> kept;
  bool inBlock = false;
  for (const auto &line : splitLines(content)) {
    const std::string trimmed = trimCopy(line);
    if (trimmed == kMarkerBegin) {
      inBlock = true;
      continue;
    }
    if (trimmed == kMarkerEnd) {
      inBlock = false;
      continue;
    }
    if (!inBlock)
      kept.push_back(line);
  }

  while (!kept.empty() && trimCopy(kept.back()).empty())
    kept.pop_back();

  std::string out;
  for (std::size_t i = 0; i < kept.size(); ++i) {
    if (i > 0)
      out += '\n';
    out += kept[i];
  }
  out += '\n';
  return out;
}

std::string buildContent(const std::string &content,
                         const std::vector<std::string> &domains) {
  std::string base = stripBlock(content);
  if (domains.empty())
    return base;

  std::vector<std::string> sorted(domains);
  std::sort(sorted.begin(), sorted.end());

  std::ostringstream block;
  block << kMarkerBegin << '\n';
  for (const auto &d : sorted) {
    block << kLoopback << ' ' << d << '\n';
    if (d.rfind("www.", 0) != 0)
      block << kLoopback << " www." << d << '\n';
  }
  block << kMarkerEnd << '\n';

  return trimEndCopy(base) + "\n\n" + block.str();
}

bool isActive(const std::string &content) {
  return content.find(kMarkerBegin) != std::string::npos &&
         content.find(kMarkerEnd) != std::string::npos;
}

std::vector<std::string> blockedDomains(const std::string &content) {
  std::vector<std::string> names;
  bool inBlock = false;
  for (const auto &line : splitLines(content)) {
    const std::string trimmed = trimCopy(line);
    if (trimmed == kMarkerBegin) {
      inBlock = true;
      continue;
    }
    if (trimmed == kMarkerEnd) {
      inBlock = false;
      continue;
    }
    if (!inBlock || trimmed.empty() || trimmed[0] == '#')
      continue;
    std::istringstream fields(trimmed);
    std::string address;
    std::string name;
    fields >> address;
    while (fields >> name)
      names.push_back(name);
  }
  return names;
}

bool needsSync(const std::string &content,
               const std::vector<std::string> &domains) {
  return buildContent(content, domains) != content;
}

} // namespace hosts
} // namespace siteblocker
