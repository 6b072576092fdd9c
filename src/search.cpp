#include "search.hpp"
#include "fold.hpp"
#include "lines.hpp"
#include <string>

std::vector<std::string_view> search(std::string_view query,
                                     std::string_view contents,
                                     bool case_sensitive) {
  std::vector<std::string_view> results;
  if (contents.empty()) return results;

  // lowercase the query once
  const std::string folded_query = case_sensitive ? std::string() : to_lower(query);
  const std::string_view needle = case_sensitive ? query : std::string_view(folded_query);

  std::string folded;
  for (std::string_view line : split_lines(contents)) {
    bool hit;
    if (case_sensitive) {
      hit = line.find(needle) != std::string_view::npos;
    } else {
      folded = to_lower(line);
      hit = folded.find(needle) != std::string::npos;
    }
    if (hit) results.push_back(line);
  }
  return results;
}
