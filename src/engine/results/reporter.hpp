#pragma once
#include <memory>
#include <string>

#include "../../core/types/response.hpp"
#include "../../storage/storage.hpp"

namespace Burrow {
namespace Engine {

/// Prints accepted responses and mirrors them to the output file, if any.
/// With `json` set the file gets one JSON object per line instead of the report line.
class Reporter {
public:
    Reporter(std::unique_ptr<Burrow::Storage::Storage> storage,
             std::string                               output_key,
             bool                                      json = false);

    void report(const Burrow::Core::Response& response);

private:
    std::unique_ptr<Burrow::Storage::Storage> storage_;
    std::string                               output_key_;
    bool                                      json_;
};

}  // namespace Engine
}  // namespace Burrow
