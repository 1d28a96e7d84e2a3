#include "errors.hpp"

namespace Gleaner {
namespace Core {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidJob: return "invalid_job";
        case ErrorKind::NoProxyAvailable: return "no_proxy_available";
        case ErrorKind::FetchExhausted: return "fetch_exhausted";
        case ErrorKind::DefenseDetected: return "blocked";
        case ErrorKind::ExtractionField: return "extraction_field";
        case ErrorKind::JobAborted: return "job_aborted";
        case ErrorKind::Config: return "config";
        case ErrorKind::Template: return "template";
    }
    return "unknown";
}

}  // namespace Core
}  // namespace Gleaner
