#pragma once
#include <string_view>
#include <vector>

// Lines end at '\n'; a '\r' right before it is not part of the line.
// The views point into `contents` and must not outlive it.
std::vector<std::string_view> split_lines(std::string_view contents);
