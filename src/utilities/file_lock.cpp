#include "utilities/file_lock.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <sys/file.h>
#include <unistd.h>

namespace siteblocker {

ScopedFileLock::ScopedFileLock(const std::string &lockPath) : fd_(-1) {
  fd_ = ::open(lockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
  if (fd_ < 0) {
    throw std::runtime_error("Unable to open lock file " + lockPath + ": " +
                             std::strerror(errno));
  }
  while (::flock(fd_, LOCK_EX) != 0) {
    if (errno == EINTR)
      continue;
    int err = errno;
    ::close(fd_);
    fd_ = -1;
    throw std::runtime_error("Unable to lock " + lockPath + ": " +
                             std::strerror(err));
  }
}

ScopedFileLock::~ScopedFileLock() {
  if (fd_ >= 0) {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
  }
}

} // namespace siteblocker
