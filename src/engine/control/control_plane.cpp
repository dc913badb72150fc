#include "control_plane.hpp"
#include <poll.h>
#include <unistd.h>
#include "../../core/logger/logger.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Burrow {
namespace Engine {

namespace {
constexpr int STDIN_POLL_INTERVAL_MS = 100;
}  // namespace

ControlPlane::ControlPlane(Governor& governor, const ScanRegistry& registry, std::ostream& out)
    : governor_(governor), registry_(registry), out_(out) {
}

ControlPlane::~ControlPlane() {
    stop();
}

void ControlPlane::start() {
    if (!::isatty(STDIN_FILENO)) {
        Logger::debug("stdin is not a terminal; interactive menu disabled");
        return;
    }
    if (running_.exchange(true))
        return;
    listener_ = std::thread([this]() { listen(); });
    Logger::info("Press Enter to pause and cancel scans");
}

void ControlPlane::stop() {
    running_ = false;
    if (listener_.joinable())
        listener_.join();
}

bool ControlPlane::menu_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return menu_open_;
}

void ControlPlane::listen() {
    while (running_) {
        pollfd fd{STDIN_FILENO, POLLIN, 0};
        int    ready = ::poll(&fd, 1, STDIN_POLL_INTERVAL_MS);
        if (ready < 0) {
            Logger::warn("Polling stdin failed; interactive menu disabled");
            return;
        }
        if (ready == 0)
            continue;
        if (fd.revents & (POLLHUP | POLLERR))
            return;

        std::string line;
        if (!std::getline(std::cin, line))
            return;
        handle_line(line);
    }
}

void ControlPlane::handle_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!menu_open_) {
        if (!Burrow::Utils::Text::trim(line).empty())
            return;
        governor_.pause();
        entries_   = Menu::build(registry_);
        menu_open_ = true;
        out_ << Menu::render(entries_) << std::flush;
        return;
    }

    for (size_t index : Menu::parse_selection(line)) {
        if (index > entries_.size()) {
            Logger::warn("No scan numbered " + std::to_string(index));
            continue;
        }
        const auto& entry = entries_[index - 1];
        governor_.cancel_tree(entry.id, "user");
    }

    entries_.clear();
    menu_open_ = false;
    governor_.resume();
}

}  // namespace Engine
}  // namespace Burrow
