#pragma once
#include <string>
#include <string_view>

// Simple lowercasing, one code point at a time (ICU u_tolower), independent
// of the locale. Bytes that are not well-formed UTF-8 are copied unchanged.
std::string to_lower(std::string_view s);
