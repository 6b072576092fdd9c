#include "lines.hpp"

std::vector<std::string_view> split_lines(std::string_view contents) {
  std::vector<std::string_view> out;
  size_t start = 0;
  for (size_t i = 0; i < contents.size(); ++i) {
    if (contents[i] != '\n') continue;
    size_t end = i;
    if (end > start && contents[end-1] == '\r') --end;
    out.push_back(contents.substr(start, end - start));
    start = i + 1;
  }
  // unterminated last line
  if (start < contents.size()) out.push_back(contents.substr(start));
  return out;
}
