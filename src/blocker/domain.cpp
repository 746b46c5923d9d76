#include "blocker/domain.hpp"
#include "blocker/errors.hpp"

#include <algorithm>
#include <cctype>

namespace siteblocker {

namespace {

std::string trimCopy(const std::string &value) {
  auto begin = value.find_first_not_of(" \t\r\n\f\v");
  if (begin == std::string::npos)
    return {};
  auto end = value.find_last_not_of(" \t\r\n\f\v");
  return value.substr(begin, end - begin + 1);
}

std::string toLowerCopy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return value;
}

bool startsWithNoCase(const std::string &value, const std::string &prefix) {
  if (value.size() < prefix.size())
    return false;
  return toLowerCopy(value.substr(0, prefix.size())) == prefix;
}

bool stripPrefixNoCase(std::string &value, const std::string &prefix) {
  if (!startsWithNoCase(value, prefix))
    return false;
  value.erase(0, prefix.size());
  return true;
}

} // namespace

std::string normalizeDomain(const std::string &raw) {
  std::string d = trimCopy(raw);
  if (d.empty())
    throw EmptyInputError();

  // Strip prefixes until none is left so that normalizing an already
  // normalized value never changes it ("www.www.x.com" included).
  bool stripped = true;
  while (stripped) {
    stripped = stripPrefixNoCase(d, "https://") || stripPrefixNoCase(d, "http://");
    stripped = stripPrefixNoCase(d, "www.") || stripped;
    if (stripped)
      d = trimCopy(d);
  }

  auto slash = d.find('/');
  if (slash != std::string::npos)
    d.erase(slash);

  d = trimCopy(toLowerCopy(d));
  if (d.find('.') == std::string::npos)
    throw InvalidDomainError(d);
  return d;
}

} // namespace siteblocker
