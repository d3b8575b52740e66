#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace cfi::util {

// Strips ASCII whitespace (space, \t, \n, \r, \v, \f, NUL) from both ends.
std::string trim(std::string_view s);

std::string toLower(std::string_view s);
std::string toUpper(std::string_view s);

// Splits on '\n'; a trailing '\r' is left for trim() to remove.
std::vector<std::string> splitLines(std::string_view s);

std::string joinLines(const std::vector<std::string>& lines);

}
