#pragma once
#include <string>

namespace Burrow {
namespace Storage {

class Storage {
public:
    virtual ~Storage() = default;

    /// Replaces the content of `key`; readers see either the old or the new content.
    virtual bool save(const std::string& key, const std::string& content) = 0;

    virtual bool append(const std::string& key, const std::string& content) = 0;

    /// Throws std::runtime_error when `key` cannot be read.
    virtual std::string load(const std::string& key) const = 0;
};

}  // namespace Storage
}  // namespace Burrow
