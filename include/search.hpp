#pragma once
#include <string_view>
#include <vector>

// Lines of `contents` containing `query`, in file order.
// With case_sensitive == false both sides are lowercased (see to_lower)
// before the test; the returned views still show the original text.
// The query is taken literally.
std::vector<std::string_view> search(std::string_view query,
                                     std::string_view contents,
                                     bool case_sensitive);
