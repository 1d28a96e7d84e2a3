#include "log_progress_sink.hpp"
#include <cmath>
#include "../core/logger/logger.hpp"

namespace Gleaner {
namespace Sink {

void LogProgressSink::on_progress(const Engine::Job::ProgressEvent& event) {
    const auto& p   = event.progress;
    std::string msg = "[" + event.id.substr(0, 8) + "] " + Engine::Job::to_string(p.status) + " | "
                      + std::to_string(p.pages_fetched) + " pages, "
                      + std::to_string(p.items_extracted) + " items, "
                      + std::to_string(p.items_failed) + " failed";
    if (p.percent)
        msg += " | " + std::to_string(static_cast<int>(std::round(*p.percent * 100))) + "%";
    Core::Logger::info(msg);
}

}  // namespace Sink
}  // namespace Gleaner
