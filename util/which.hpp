#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which. Returns an empty string if
// cmd is not found in any folder of PATH, and throws if PATH is not set.
// Found commands are cached, unless use_cache is false; a cached entry is
// returned even if the file has since disappeared.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
