#pragma once
#include <string>
#include <vector>
#include "../../core/types/constants.hpp"
#include "../../network/http/fetcher.hpp"

namespace Gleaner {
namespace Fetch {
namespace Defense {

// Decides whether a response is an automated-traffic challenge rather than
// the requested document.
class DefenseDetector {
public:
    virtual ~DefenseDetector() = default;

    virtual bool is_defense_response(const Network::Http::RawDocument& doc) const = 0;
};

/**
 * @brief Signature-based detector.
 *
 * Flags status 429, bodies carrying a known captcha/challenge marker, and
 * 403/503 responses that either carry a challenge header (cf-ray,
 * x-sucuri-id, ...) or a body too small to be a real page.
 */
class SignatureDefenseDetector : public DefenseDetector {
public:
    explicit SignatureDefenseDetector(
        std::vector<std::string> markers = Core::get_default_defense_markers(),
        size_t                   tiny_body_threshold = 512);

    bool is_defense_response(const Network::Http::RawDocument& doc) const override;

    const std::vector<std::string>& markers() const {
        return markers_;
    }

private:
    bool has_marker(const std::string& body) const;
    bool has_challenge_header(const Network::Http::RawDocument& doc) const;

    std::vector<std::string> markers_;
    size_t                   tiny_body_threshold_;
};

}  // namespace Defense
}  // namespace Fetch
}  // namespace Gleaner
