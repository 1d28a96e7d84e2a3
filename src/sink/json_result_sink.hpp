#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include "sink.hpp"

namespace Gleaner {
namespace Sink {

nlohmann::ordered_json to_json(const Engine::Job::PageResult& page);
nlohmann::ordered_json to_json(const Engine::Job::JobSnapshot& snapshot);

// Writes <base_path>/<job_id>.json holding the snapshot and every page.
class JsonResultSink : public ResultSink {
public:
    explicit JsonResultSink(const std::string& base_path);
    ~JsonResultSink() override = default;

    void on_job_finished(const Engine::Job::JobSnapshot&             snapshot,
                         const std::vector<Engine::Job::PageResult>& pages) override;

    std::string path_for(const Engine::Job::JobId& id) const;

private:
    std::string base_path_;
};

}  // namespace Sink
}  // namespace Gleaner
