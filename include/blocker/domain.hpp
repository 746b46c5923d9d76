#ifndef SITEBLOCKER_DOMAIN_HPP
#define SITEBLOCKER_DOMAIN_HPP

#include <string>

namespace siteblocker {

/**
 * @brief Canonicalize a user supplied domain or URL.
 *
 * Trims, strips any leading http(s) schemes and "www." labels and any path, then
 * lowercases. The result must contain a dot. normalizeDomain is idempotent.
 *
 * @throws EmptyInputError if @p raw is blank.
 * @throws InvalidDomainError if the result has no '.'.
 */
std::string normalizeDomain(const std::string &raw);

} // namespace siteblocker

#endif // SITEBLOCKER_DOMAIN_HPP
