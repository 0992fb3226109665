#ifndef UTIL_ID_HPP
#define UTIL_ID_HPP

#include <string>

namespace util {

// Returns a random RFC 4122 version 4 identifier, in its 36 character
// textual form.
std::string RandomId();

// Maps an identifier to the restricted alphabet [a-z0-9_-] used for host
// paths: the input is trimmed and lowercased, every other character becomes
// '-', and leading or trailing dashes are removed. May return "".
std::string SanitizeId(const std::string& raw);

}  // namespace util

#endif
