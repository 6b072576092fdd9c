#include "loader.hpp"
#include "errors.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

bool is_valid_utf8(std::string_view s) {
  size_t i = 0;
  while (i < s.size()) {
    uint8_t b0 = (uint8_t)s[i];
    if (b0 < 0x80) { ++i; continue; }

    size_t len;
    uint32_t cp;
    uint32_t min;
    if ((b0 & 0xE0) == 0xC0)      { len = 2; cp = b0 & 0x1F; min = 0x80; }
    else if ((b0 & 0xF0) == 0xE0) { len = 3; cp = b0 & 0x0F; min = 0x800; }
    else if ((b0 & 0xF8) == 0xF0) { len = 4; cp = b0 & 0x07; min = 0x10000; }
    else return false;

    if (s.size() - i < len) return false;
    for (size_t k = 1; k < len; ++k) {
      uint8_t b = (uint8_t)s[i+k];
      if ((b & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (b & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF) return false;
    if (cp >= 0xD800 && cp <= 0xDFFF) return false;
    i += len;
  }
  return true;
}

std::string read_file(const std::string& path) {
  std::error_code ec;
  if (fs::is_directory(path, ec)) {
    throw RuntimeError(RuntimeError::Kind::FileReadFailure,
                       "Cannot read file " + path + ": is a directory");
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw RuntimeError(RuntimeError::Kind::FileReadFailure,
                       "Cannot open file " + path);
  }
  std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw RuntimeError(RuntimeError::Kind::FileReadFailure,
                       "Cannot read file " + path);
  }
  if (!is_valid_utf8(data)) {
    throw RuntimeError(RuntimeError::Kind::FileReadFailure,
                       "File " + path + " is not valid UTF-8");
  }
  return data;
}
