#pragma once
#ifndef SITEBLOCKER_ERRORS_HPP
#define SITEBLOCKER_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace siteblocker {

/// Base class for every error raised by the blocking engine.
class SiteBlockerError : public std::runtime_error {
public:
  explicit SiteBlockerError(const std::string &what)
      : std::runtime_error(what) {}
};

class EmptyInputError : public SiteBlockerError {
public:
  EmptyInputError() : SiteBlockerError("Domain cannot be empty") {}
};

class InvalidDomainError : public SiteBlockerError {
public:
  explicit InvalidDomainError(const std::string &domain)
      : SiteBlockerError("Invalid domain: " + domain), domain_(domain) {}
  const std::string &domain() const { return domain_; }

private:
  std::string domain_;
};

/// The hosts file does not look like a hosts file.
class SafetyCheckError : public SiteBlockerError {
public:
  explicit SafetyCheckError(const std::string &what) : SiteBlockerError(what) {}
};

/// Elevation denied or cancelled, or the elevated script failed.
class PrivilegedWriteError : public SiteBlockerError {
public:
  PrivilegedWriteError(const std::string &what, int exitCode,
                       const std::string &output)
      : SiteBlockerError(what), exitCode_(exitCode), output_(output) {}
  int exitCode() const { return exitCode_; }
  const std::string &output() const { return output_; }

private:
  int exitCode_;
  std::string output_;
};

class ConfigReadError : public SiteBlockerError {
public:
  explicit ConfigReadError(const std::string &what) : SiteBlockerError(what) {}
};

class ConfigWriteError : public SiteBlockerError {
public:
  explicit ConfigWriteError(const std::string &what) : SiteBlockerError(what) {}
};

/// Raised internally by the supervisor; never escapes ensureRunning().
class LoggerStartError : public SiteBlockerError {
public:
  explicit LoggerStartError(const std::string &what) : SiteBlockerError(what) {}
};

/// Raised internally by the access log reader; never escapes read().
class LogParseError : public SiteBlockerError {
public:
  explicit LogParseError(const std::string &what) : SiteBlockerError(what) {}
};

class NoDomainsConfiguredError : public SiteBlockerError {
public:
  NoDomainsConfiguredError()
      : SiteBlockerError("No domains to block. Add some first.") {}
};

} // namespace siteblocker

#endif // SITEBLOCKER_ERRORS_HPP
