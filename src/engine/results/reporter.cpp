#include "reporter.hpp"
#include <nlohmann/json.hpp>
#include "../../core/logger/logger.hpp"
#include "../../utils/url/url.hpp"

namespace Burrow {
namespace Engine {

using Burrow::Core::Logger;

Reporter::Reporter(std::unique_ptr<Burrow::Storage::Storage> storage,
                   std::string                               output_key,
                   bool                                      json)
    : storage_(std::move(storage)), output_key_(std::move(output_key)), json_(json) {
}

void Reporter::report(const Burrow::Core::Response& response) {
    std::string line = response.as_report_line();
    Logger::success(line);

    if (!storage_ || output_key_.empty())
        return;

    if (json_) {
        nlohmann::json entry = response;
        entry["type"]        = "response";
        entry["extension"]   = Burrow::Utils::Url::extension(response.url);
        line                 = entry.dump();
    }
    if (!storage_->append(output_key_, line + "\n"))
        Logger::warn("Could not write result to " + output_key_);
}

}  // namespace Engine
}  // namespace Burrow
