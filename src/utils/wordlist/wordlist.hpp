#pragma once
#include <string>
#include <vector>

namespace Burrow {
namespace Utils {

class Wordlist {
public:
    /// Throws Core::ConfigError if the file cannot be opened.
    static std::vector<std::string> load(const std::string& path);

    /// Trimmed entry, or empty when the line is blank, a comment or malformed.
    static std::string clean(const std::string& line, size_t line_number);
};

}  // namespace Utils
}  // namespace Burrow
