#ifndef SITEBLOCKER_HOSTS_BLOCK_HPP
#define SITEBLOCKER_HOSTS_BLOCK_HPP

#include <string>
#include <vector>

namespace siteblocker {

/**
 * @brief Pure text transforms over hosts file content.
 *
 * The managed block is the region between the kMarkerBegin and kMarkerEnd
 * lines. Everything outside it is left untouched apart from trailing blank
 * lines. No function here performs I/O.
 */
namespace hosts {

inline constexpr const char *kMarkerBegin = "# BEGIN SITE-BLOCKER";
inline constexpr const char *kMarkerEnd = "# END SITE-BLOCKER";
inline constexpr const char *kLoopback = "127.0.0.1";

/// Remove every managed region and normalize the tail to one newline.
std::string stripBlock(const std::string &content);

/**
 * @brief Replace the managed block with one listing @p domains.
 *
 * Domains are sorted; each maps to loopback together with its "www."
 * alias unless it already starts with "www.". An empty list only strips.
 */
std::string buildContent(const std::string &content,
                         const std::vector<std::string> &domains);

/// True when both marker strings occur anywhere in @p content.
bool isActive(const std::string &content);

/// Host names listed inside managed regions, in file order.
std::vector<std::string> blockedDomains(const std::string &content);

/// True when rewriting @p content for @p domains would change it.
bool needsSync(const std::string &content,
               const std::vector<std::string> &domains);

} // namespace hosts
} // namespace siteblocker

#endif // SITEBLOCKER_HOSTS_BLOCK_HPP
