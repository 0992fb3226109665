#include "util/id.hpp"

#include <random>

#include "absl/strings/ascii.h"
#include "absl/strings/str_format.h"
#include "absl/synchronization/mutex.h"

namespace util {

std::string RandomId() {
  static absl::Mutex mutex(absl::kConstInit);
  static std::mt19937_64* generator = new std::mt19937_64(std::random_device{}());
  uint64_t high;
  uint64_t low;
  {
    absl::MutexLock lock(&mutex);
    high = (*generator)();
    low = (*generator)();
  }
  high = (high & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
  low = (low & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;
  return absl::StrFormat("%08x-%04x-%04x-%04x-%012x", high >> 32,
                         (high >> 16) & 0xffff, high & 0xffff, low >> 48,
                         low & 0xffffffffffffULL);
}

std::string SanitizeId(const std::string& raw) {
  std::string lower = absl::AsciiStrToLower(absl::StripAsciiWhitespace(raw));
  std::string id;
  id.reserve(lower.size());
  for (char c : lower) {
    // One replacement per UTF-8 sequence: continuation bytes are dropped.
    if ((static_cast<unsigned char>(c) & 0xc0) == 0x80) continue;
    bool allowed = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                   c == '-' || c == '_';
    id.push_back(allowed ? c : '-');
  }
  size_t begin = id.find_first_not_of('-');
  if (begin == std::string::npos) return "";
  size_t end = id.find_last_not_of('-');
  return id.substr(begin, end - begin + 1);
}

}  // namespace util
