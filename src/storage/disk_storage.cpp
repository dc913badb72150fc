#include "disk_storage.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include "../core/logger/logger.hpp"

namespace Burrow {
namespace Storage {

namespace fs = std::filesystem;
using Burrow::Core::Logger;

DiskStorage::DiskStorage(const std::string& base_path) : base_path_(base_path) {
    if (!base_path_.empty()) {
        std::error_code ec;
        fs::create_directories(base_path_, ec);
        if (ec)
            Logger::error("Failed to create storage directory " + base_path_ + ": " + ec.message());
    }
}

fs::path DiskStorage::resolve(const std::string& key) const {
    if (base_path_.empty())
        return fs::path(key);
    return fs::path(base_path_) / key;
}

bool DiskStorage::save(const std::string& key, const std::string& content) {
    fs::path path = resolve(key);
    fs::path tmp  = path;
    tmp += ".tmp";

    try {
        if (path.has_parent_path())
            fs::create_directories(path.parent_path());

        {
            std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
            if (!file.is_open()) {
                Logger::error("Write Error: " + tmp.string());
                return false;
            }
            file.write(content.data(), static_cast<std::streamsize>(content.size()));
            file.flush();
            if (!file) {
                Logger::error("Write Error: " + tmp.string());
                return false;
            }
        }

        fs::rename(tmp, path);
        return true;
    } catch (const fs::filesystem_error& e) {
        Logger::error("FS Error: " + std::string(e.what()));
        std::error_code ec;
        fs::remove(tmp, ec);
        return false;
    }
}

bool DiskStorage::append(const std::string& key, const std::string& content) {
    fs::path path = resolve(key);

    std::lock_guard<std::mutex> lock(append_mutex_);
    try {
        if (path.has_parent_path())
            fs::create_directories(path.parent_path());
    } catch (const fs::filesystem_error& e) {
        Logger::error("FS Error: " + std::string(e.what()));
        return false;
    }

    std::ofstream file(path, std::ios::binary | std::ios::app);
    if (!file.is_open()) {
        Logger::error("Write Error: " + path.string());
        return false;
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    return static_cast<bool>(file);
}

std::string DiskStorage::load(const std::string& key) const {
    fs::path      path = resolve(key);
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
        throw std::runtime_error("Cannot open " + path.string());

    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

}  // namespace Storage
}  // namespace Burrow
