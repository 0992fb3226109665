#include "util/utf8.hpp"

namespace {

bool IsContinuation(unsigned char c) { return (c & 0xc0) == 0x80; }

// Length of the well-formed sequence starting at pos, or 0.
size_t SequenceLength(const std::string& data, size_t pos) {
  unsigned char lead = data[pos];
  if (lead < 0x80) return 1;
  size_t length;
  unsigned char low = 0x80;
  unsigned char high = 0xbf;
  if (lead >= 0xc2 && lead <= 0xdf) {
    length = 2;
  } else if (lead >= 0xe0 && lead <= 0xef) {
    length = 3;
    if (lead == 0xe0) low = 0xa0;   // overlong
    if (lead == 0xed) high = 0x9f;  // surrogates
  } else if (lead >= 0xf0 && lead <= 0xf4) {
    length = 4;
    if (lead == 0xf0) low = 0x90;   // overlong
    if (lead == 0xf4) high = 0x8f;  // above U+10FFFF
  } else {
    return 0;
  }
  if (pos + length > data.size()) return 0;
  unsigned char second = data[pos + 1];
  if (second < low || second > high) return 0;
  for (size_t i = 2; i < length; i++) {
    if (!IsContinuation(data[pos + i])) return 0;
  }
  return length;
}

}  // namespace

namespace util {

std::string ValidUtf8(std::string data) {
  size_t pos = 0;
  while (pos < data.size()) {
    size_t length = SequenceLength(data, pos);
    if (length == 0) {
      data[pos++] = '?';
    } else {
      pos += length;
    }
  }
  return data;
}

}  // namespace util
