#ifndef UNIQUE_NAME_RESOLVER_HPP
#define UNIQUE_NAME_RESOLVER_HPP

#include "Types.hpp"

#include <string>

namespace UniqueNameResolver {

/**
 * @brief Derives a filename for @p title that is not yet in @p issued.
 *
 * The title is tokenized, shortened to @p max_base_len, sanitized, and joined
 * with @p extension. A taken name gets "-v2", "-v3", ... up to "-v50"; past
 * that a "-x" + 6 hex digit SHA-256 prefix of the title is used instead,
 * re-salted while taken and finally numbered ("-x02cdaa-2", "-x02cdaa-3", ...).
 * A free name is always found. The result never exceeds 255 bytes.
 * @p issued is not modified.
 *
 * @param issued Case-folded names already handed out in this session.
 * @throws ErrorCodes::AppException for a negative @p max_base_len
 *         (VALIDATION_VALUE_OUT_OF_RANGE) or an extension that does not start
 *         with a dot (VALIDATION_INVALID_FORMAT).
 */
std::string resolve_unique(const std::string& title,
                           const std::string& extension,
                           const IssuedNameSet& issued,
                           int max_base_len = kDefaultMaxBaseLength,
                           bool use_spaces = true);

// Sanitized, not yet deduplicated candidate for title + extension.
std::string initial_candidate(const std::string& title,
                              const std::string& extension,
                              int max_base_len,
                              bool use_spaces);

} // namespace UniqueNameResolver

#endif
