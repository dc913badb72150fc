#pragma once
#include <filesystem>
#include <mutex>
#include <string>
#include "storage.hpp"

namespace Burrow {
namespace Storage {

/**
 * @brief Files below a base directory (or relative to the working directory).
 *
 * save() writes `<key>.tmp` and renames it over `<key>`, so an interrupted
 * write never leaves a truncated file behind.
 */
class DiskStorage : public Storage {
public:
    explicit DiskStorage(const std::string& base_path = "");
    ~DiskStorage() override = default;

    bool        save(const std::string& key, const std::string& content) override;
    bool        append(const std::string& key, const std::string& content) override;
    std::string load(const std::string& key) const override;

private:
    std::string base_path_;
    std::mutex  append_mutex_;

    std::filesystem::path resolve(const std::string& key) const;
};

}  // namespace Storage
}  // namespace Burrow
