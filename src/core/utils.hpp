#pragma once

#include <string>
#include <cstddef>

// ASCII lowercase copy. Bytes outside A-Z pass through unchanged.
std::string to_lower(const std::string& s);

// Left-align `s` in a field of `width` bytes. Longer strings are returned as-is.
std::string pad_right(const std::string& s, size_t width);

