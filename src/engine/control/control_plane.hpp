#pragma once
#include <atomic>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "../governor/governor.hpp"
#include "../registry/scan_registry.hpp"
#include "menu.hpp"

namespace Burrow {
namespace Engine {

/**
 * @brief Keyboard control of a running scan.
 *
 * Enter pauses everything and shows the cancel menu; the next line selects
 * scans to cancel (with their descendants) and resumes.
 */
class ControlPlane {
public:
    ControlPlane(Governor& governor, const ScanRegistry& registry, std::ostream& out = std::cout);
    ~ControlPlane();

    /// Starts the stdin listener; does nothing when stdin is not a terminal.
    void start();
    void stop();

    void handle_line(const std::string& line);

    bool menu_open() const;

private:
    Governor&           governor_;
    const ScanRegistry& registry_;
    std::ostream&       out_;

    mutable std::mutex     mutex_;
    std::vector<MenuEntry> entries_;
    bool                   menu_open_ = false;

    std::thread       listener_;
    std::atomic<bool> running_{false};

    void listen();
};

}  // namespace Engine
}  // namespace Burrow
