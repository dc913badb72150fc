#pragma once

#include <string>
#include <vector>

namespace Burrow {
namespace Utils {
namespace Text {

std::string              trim(const std::string& str);
std::string              to_lower(const std::string& str);
bool                     starts_with(const std::string& str, const std::string& prefix);
bool                     ends_with(const std::string& str, const std::string& suffix);
std::vector<std::string> split(const std::string& str, char delimiter);

/// Whitespace separated tokens.
size_t count_words(const std::string& body);
/// Number of '\n' separated lines; an empty body has zero lines.
size_t count_lines(const std::string& body);

}  // namespace Text
}  // namespace Utils
}  // namespace Burrow
