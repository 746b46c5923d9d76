#ifndef SITEBLOCKER_CONFIG_STORE_HPP
#define SITEBLOCKER_CONFIG_STORE_HPP

#include <string>
#include <vector>

namespace siteblocker {

/**
 * @brief Persisted blocker state.
 */
struct Config {
  std::vector<std::string> domains; ///< Normalized, unique, insertion order.
  bool enabled = false;
};

/**
 * @brief Reads and writes the per-user blocked.json file.
 *
 * The JSON document is `{"domains": [...], "enabled": bool}`. Mutating
 * operations hold an advisory lock on `<path>.lock` while they read, modify
 * and write the file.
 */
class ConfigStore {
public:
  explicit ConfigStore(std::string path);

  const std::string &path() const { return path_; }

  /**
   * @brief Load the config, creating a default file when none exists.
   * @throws ConfigReadError on malformed or mis-shaped JSON.
   */
  Config load() const;

  /**
   * @brief Write @p config via a temporary sibling file and rename.
   * @throws ConfigWriteError when the directory or file cannot be written.
   */
  void save(const Config &config) const;

  /**
   * @brief Normalize and append domains that are not yet stored.
   * @return The domains actually added, in arrival order.
   */
  std::vector<std::string> add(const std::vector<std::string> &domains) const;

  /**
   * @brief Normalize and drop matching stored domains.
   * @return The domains actually removed.
   */
  std::vector<std::string> remove(const std::vector<std::string> &domains) const;

  /** Update the enabled flag; always persists. */
  void setEnabled(bool enabled) const;

private:
  Config loadUnlocked() const;
  std::string lockPath() const { return path_ + ".lock"; }

  std::string path_;
};

} // namespace siteblocker

#endif // SITEBLOCKER_CONFIG_STORE_HPP
