#pragma once
#include <string>
#include <vector>

#include "../registry/scan_registry.hpp"

namespace Burrow {
namespace Engine {

struct MenuEntry {
    size_t      index = 0;  // 1-based, as printed
    ScanId      id    = 0;
    std::string url;
};

/// The interactive cancel menu shown while scanning is paused.
class Menu {
public:
    /// Scans with a parent that are neither terminal nor File records, oldest first.
    static std::vector<MenuEntry> build(const ScanRegistry& registry);

    static std::string render(const std::vector<MenuEntry>& entries);

    /// "1,3-4" -> {1, 3, 4}. Invalid tokens are skipped with a warning.
    static std::vector<size_t> parse_selection(const std::string& line);
};

}  // namespace Engine
}  // namespace Burrow
