#pragma once

namespace Gleaner {
namespace Core {

// Classified result of one fetch attempt.
enum class FetchOutcome { Success, Timeout, Refused, NetworkError, DefenseDetected, HttpError, Cancelled };

inline const char* to_string(FetchOutcome outcome) {
    switch (outcome) {
        case FetchOutcome::Success: return "success";
        case FetchOutcome::Timeout: return "timeout";
        case FetchOutcome::Refused: return "refused";
        case FetchOutcome::NetworkError: return "network_error";
        case FetchOutcome::DefenseDetected: return "defense_detected";
        case FetchOutcome::HttpError: return "http_error";
        case FetchOutcome::Cancelled: return "cancelled";
    }
    return "unknown";
}

}  // namespace Core
}  // namespace Gleaner
