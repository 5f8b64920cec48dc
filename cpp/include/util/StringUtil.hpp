#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace util {

// Splits on runs of whitespace, like python's s.split(). Leading and trailing whitespace produce
// no empty tokens.
std::vector<std::string> split(std::string_view s);

// ASCII lowercase
std::string to_lower(std::string_view s);

// "x and y"
// "x, y, and z"  (oxford_comma = true)
// "x, y and z" (oxford_comma = false)
std::string grammatically_join(const std::vector<std::string>& items,
                               const std::string& conjunction, bool oxford_comma = true);

}  // namespace util

#include "inline/util/StringUtil.inl"
