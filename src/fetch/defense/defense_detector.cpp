#include "defense_detector.hpp"
#include <algorithm>
#include "../../utils/text/string_utils.hpp"

namespace Gleaner {
namespace Fetch {
namespace Defense {

namespace {

// Challenge pages put their markers near the top; large documents are not
// scanned in full.
constexpr size_t SCAN_LIMIT = 256 * 1024;

}  // namespace

SignatureDefenseDetector::SignatureDefenseDetector(std::vector<std::string> markers,
                                                   size_t                   tiny_body_threshold)
    : tiny_body_threshold_(tiny_body_threshold) {
    for (auto& marker : markers) {
        auto lowered = Utils::Text::to_lower(Utils::Text::trim(marker));
        if (!lowered.empty())
            markers_.push_back(std::move(lowered));
    }
}

bool SignatureDefenseDetector::has_marker(const std::string& body) const {
    std::string head = Utils::Text::to_lower(body.substr(0, std::min(body.size(), SCAN_LIMIT)));
    for (const auto& marker : markers_) {
        if (head.find(marker) != std::string::npos)
            return true;
    }
    return false;
}

bool SignatureDefenseDetector::has_challenge_header(const Network::Http::RawDocument& doc) const {
    for (const auto& name : Core::get_challenge_headers()) {
        if (doc.headers.count(name))
            return true;
    }
    return false;
}

bool SignatureDefenseDetector::is_defense_response(const Network::Http::RawDocument& doc) const {
    if (!doc.network_ok())
        return false;
    if (doc.status_code == 429)
        return true;
    if (has_marker(doc.body))
        return true;
    if (doc.status_code == 403 || doc.status_code == 503) {
        if (has_challenge_header(doc))
            return true;
        if (Utils::Text::trim(doc.body).size() < tiny_body_threshold_)
            return true;
    }
    return false;
}

}  // namespace Defense
}  // namespace Fetch
}  // namespace Gleaner
