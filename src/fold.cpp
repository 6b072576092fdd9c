#include "fold.hpp"
#include <unicode/uchar.h>
#include <unicode/utf8.h>
#include <cstdint>

std::string to_lower(std::string_view s) {
  std::string out;
  out.reserve(s.size());

  const uint8_t* p = reinterpret_cast<const uint8_t*>(s.data());
  const int32_t len = (int32_t)s.size();
  int32_t i = 0;
  while (i < len) {
    const int32_t start = i;
    UChar32 c;
    U8_NEXT(p, i, len, c);
    if (c < 0) {
      out.append(s.data() + start, (size_t)(i - start));
      continue;
    }
    const UChar32 lower = u_tolower(c);
    uint8_t buf[U8_MAX_LENGTH];
    int32_t n = 0;
    U8_APPEND_UNSAFE(buf, n, lower);
    out.append(reinterpret_cast<const char*>(buf), (size_t)n);
  }
  return out;
}
