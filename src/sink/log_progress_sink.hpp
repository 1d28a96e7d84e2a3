#pragma once
#include "sink.hpp"

namespace Gleaner {
namespace Sink {

// Reports progress through the logger at info level.
class LogProgressSink : public ProgressSink {
public:
    void on_progress(const Engine::Job::ProgressEvent& event) override;
};

}  // namespace Sink
}  // namespace Gleaner
