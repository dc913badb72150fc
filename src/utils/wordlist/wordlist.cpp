#include "wordlist.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include "../../core/config/config.hpp"
#include "../../core/logger/logger.hpp"
#include "../text/string_utils.hpp"

namespace Burrow {
namespace Utils {

using Burrow::Core::Logger;

std::string Wordlist::clean(const std::string& line, size_t line_number) {
    std::string word = Text::trim(line);
    if (word.empty() || word[0] == '#')
        return "";

    bool malformed = std::any_of(word.begin(), word.end(), [](unsigned char c) {
        return std::iscntrl(c) || std::isspace(c);
    });
    if (malformed) {
        Logger::warn("Skipping malformed wordlist entry on line " + std::to_string(line_number));
        return "";
    }
    return word;
}

std::vector<std::string> Wordlist::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open())
        throw Burrow::Core::ConfigError("Cannot open wordlist " + path);

    std::vector<std::string> words;
    std::string              line;
    size_t                   line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        std::string word = clean(line, line_number);
        if (!word.empty())
            words.push_back(std::move(word));
    }

    Logger::info("Loaded " + std::to_string(words.size()) + " words from " + path);
    return words;
}

}  // namespace Utils
}  // namespace Burrow
