#pragma once
#include <string>
#include <string_view>

bool is_valid_utf8(std::string_view s);

// Whole file as text. Throws RuntimeError(FileReadFailure) when the file
// cannot be opened or read, or is not UTF-8.
std::string read_file(const std::string& path);
