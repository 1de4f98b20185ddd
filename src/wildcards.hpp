#ifndef GAPSYNC_WILDCARDS_HPP
#define GAPSYNC_WILDCARDS_HPP

#include <string_view>

/** Matches the whole `text` against `pattern`, where '*' stands for any
 * (possibly empty) run of characters. Matching is case-sensitive. */
bool wildcard_matches(std::string_view pattern, std::string_view text);

#endif // GAPSYNC_WILDCARDS_HPP
