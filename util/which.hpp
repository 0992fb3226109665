#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which: returns the full path of the
// first executable named cmd in PATH, or an empty string. Commands that
// contain a slash are returned unchanged if they are executable. Found paths
// are cached unless use_cache is false.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
