#include "string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace Burrow {
namespace Utils {
namespace Text {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

std::string to_lower(const std::string& str) {
    std::string lower = str;
    std::transform(
        lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    return lower;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.rfind(prefix, 0) == 0;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size())
        return false;
    return std::equal(suffix.rbegin(), suffix.rend(), str.rbegin());
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::stringstream        ss(str);
    std::string              part;
    while (std::getline(ss, part, delimiter))
        parts.push_back(part);
    return parts;
}

size_t count_words(const std::string& body) {
    size_t words   = 0;
    bool   in_word = false;
    for (unsigned char c : body) {
        if (std::isspace(c)) {
            in_word = false;
        }
        else if (!in_word) {
            in_word = true;
            ++words;
        }
    }
    return words;
}

size_t count_lines(const std::string& body) {
    if (body.empty())
        return 0;
    size_t lines = static_cast<size_t>(std::count(body.begin(), body.end(), '\n'));
    if (body.back() != '\n')
        ++lines;
    return lines;
}

}  // namespace Text
}  // namespace Utils
}  // namespace Burrow
