#ifndef UTIL_UTF8_HPP
#define UTIL_UTF8_HPP

#include <string>

namespace util {

// Makes data valid UTF-8 by replacing every byte that is not part of a
// well-formed sequence with '?'. The length of data does not change, so a
// sequence split by an output cap costs as many bytes as it had.
std::string ValidUtf8(std::string data);

}  // namespace util

#endif
