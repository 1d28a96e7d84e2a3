#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "../../extract/engine/extraction_engine.hpp"
#include "../../network/http/fetcher.hpp"

namespace Gleaner {
namespace Engine {
namespace Job {

struct PageError {
    std::string kind;  // Core::to_string(ErrorKind), e.g. "blocked"
    std::string message;
};

struct PageResult {
    std::string url;
    size_t      seed        = 0;  // index of the page chain within the job
    int         page_number = 0;  // 1-based within the chain

    bool                                  success = false;
    Extract::Engine::Record               record  = Extract::Engine::Record::object();
    std::vector<Extract::Engine::FieldError> field_errors;
    double                                coverage = 0.0;
    bool                                  partial  = false;
    std::string                           next_url;

    long                      status_code = 0;
    std::chrono::milliseconds latency{0};
    std::string               proxy;
    int                       attempts = 0;

    std::optional<PageError> error;

    // Held only until the pagination decision is made.
    std::shared_ptr<const Network::Http::RawDocument> document;
};

}  // namespace Job
}  // namespace Engine
}  // namespace Gleaner
