#ifndef SITEBLOCKER_FILE_LOCK_HPP
#define SITEBLOCKER_FILE_LOCK_HPP

#include <string>

namespace siteblocker {

/**
 * @brief Exclusive advisory lock held for the lifetime of the object.
 *
 * Uses flock(2) on a side file so that concurrent processes serialize their
 * read-modify-write cycles on the guarded resource. Throws
 * std::runtime_error if the lock file cannot be opened or locked.
 */
class ScopedFileLock {
public:
  explicit ScopedFileLock(const std::string &lockPath);
  ~ScopedFileLock();

  ScopedFileLock(const ScopedFileLock &) = delete;
  ScopedFileLock &operator=(const ScopedFileLock &) = delete;

private:
  int fd_;
};

} // namespace siteblocker

#endif // SITEBLOCKER_FILE_LOCK_HPP
