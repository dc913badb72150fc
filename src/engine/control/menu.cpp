#include "menu.hpp"
#include <regex>
#include <set>
#include <sstream>
#include "../../core/logger/logger.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Burrow {
namespace Engine {

using Burrow::Core::Logger;
using namespace Burrow::Utils::Text;

std::vector<MenuEntry> Menu::build(const ScanRegistry& registry) {
    auto scans = registry.list([](const Scan& scan) {
        return scan.parent_id.has_value() && !scan.is_terminal()
               && scan.scan_type != ScanType::File;
    });

    std::vector<MenuEntry> entries;
    for (const auto& scan : scans)
        entries.push_back({entries.size() + 1, scan.id, scan.base_url});
    return entries;
}

std::string Menu::render(const std::vector<MenuEntry>& entries) {
    std::ostringstream out;
    out << "\n";
    if (entries.empty()) {
        out << "No cancelable scans. Press Enter to resume.\n";
        return out.str();
    }

    out << "Cancelable scans:\n";
    for (const auto& entry : entries)
        out << "  " << entry.index << ") " << entry.url << "\n";
    out << "Scans to cancel (e.g. 1,3-4), or Enter to resume: ";
    return out.str();
}

std::vector<size_t> Menu::parse_selection(const std::string& line) {
    static const std::regex SINGLE(R"(^\d+$)");
    static const std::regex RANGE(R"(^(\d+)\s*-\s*(\d+)$)");

    std::set<size_t> selected;
    for (const auto& raw : split(line, ',')) {
        std::string token = trim(raw);
        if (token.empty())
            continue;

        std::smatch match;
        try {
            if (std::regex_match(token, SINGLE)) {
                size_t index = std::stoul(token);
                if (index == 0) {
                    Logger::warn("Ignoring menu index 0");
                    continue;
                }
                selected.insert(index);
            } else if (std::regex_match(token, match, RANGE)) {
                size_t first = std::stoul(match[1].str());
                size_t last  = std::stoul(match[2].str());
                if (first == 0 || first > last) {
                    Logger::warn("Ignoring invalid range '" + token + "'");
                    continue;
                }
                for (size_t i = first; i <= last; ++i)
                    selected.insert(i);
            } else {
                Logger::warn("Ignoring invalid selection '" + token + "'");
            }
        } catch (const std::out_of_range&) {
            Logger::warn("Ignoring out of range selection '" + token + "'");
        }
    }
    return {selected.begin(), selected.end()};
}

}  // namespace Engine
}  // namespace Burrow
