#include "pagination_controller.hpp"
#include <cctype>
#include "../core/logger/logger.hpp"
#include "../extract/query/css_selector.hpp"
#include "../utils/text/string_utils.hpp"
#include "../utils/url/url.hpp"

namespace Gleaner {
namespace Pagination {

using Core::Logger;
using Extract::Engine::Record;
using Templates::PaginationStrategy;

namespace {

void collect_tokens(const Record& value, std::set<std::string>& tokens) {
    if (value.is_object() || value.is_array()) {
        for (const auto& item : value)
            collect_tokens(item, tokens);
        return;
    }
    if (value.is_null())
        return;

    std::string text = value.is_string() ? value.get<std::string>() : value.dump();
    std::string token;
    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c)) || static_cast<unsigned char>(c) >= 0x80) {
            token += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        else if (!token.empty()) {
            tokens.insert(token);
            token.clear();
        }
    }
    if (!token.empty())
        tokens.insert(token);
}

}  // namespace

const char* to_string(StopReason reason) {
    switch (reason) {
        case StopReason::None: return "none";
        case StopReason::MaxPages: return "max_pages";
        case StopReason::Duplicate: return "duplicate";
        case StopReason::StopSelector: return "stop_selector";
        case StopReason::Visited: return "visited";
        case StopReason::NoNextLink: return "no_next_link";
    }
    return "unknown";
}

double record_similarity(const Record& a, const Record& b) {
    std::set<std::string> ta, tb;
    collect_tokens(a, ta);
    collect_tokens(b, tb);
    if (ta.empty() || tb.empty())
        return 0.0;

    size_t common = 0;
    for (const auto& token : ta)
        common += tb.count(token);
    size_t total = ta.size() + tb.size() - common;
    return static_cast<double>(common) / total;
}

PaginationController::PaginationController(Templates::PaginationSpec spec)
    : spec_(std::move(spec)) {
}

bool PaginationController::is_duplicate(const Record& record) {
    bool duplicate = false;
    for (const auto& previous : window_) {
        if (record_similarity(record, previous) >= spec_.similarity_threshold) {
            duplicate = true;
            break;
        }
    }

    if (spec_.duplicate_window > 0) {
        window_.push_back(record);
        while (window_.size() > spec_.duplicate_window)
            window_.pop_front();
    }
    return duplicate;
}

std::optional<std::string> PaginationController::resolve_next(
    const Engine::Job::PageResult&       page,
    const Extract::Query::DocumentQuery* document,
    int                                  pages_so_far) const {
    std::string base = page.document ? page.document->base_url() : page.url;

    if (spec_.strategy == PaginationStrategy::PageParameter) {
        std::string url     = spec_.url_pattern;
        std::string page_no = std::to_string(spec_.start_page + pages_so_far);
        for (auto pos = url.find("{page}"); pos != std::string::npos; pos = url.find("{page}"))
            url.replace(pos, 6, page_no);
        std::string resolved = Utils::Url::resolve(base, url);
        if (!Utils::Url::is_http_url(resolved))
            return std::nullopt;
        return resolved;
    }

    if (!document || spec_.next_selector.empty())
        return std::nullopt;

    std::string selector = spec_.next_selector;
    if (selector.find("::") == std::string::npos)
        selector += "::attr(href)";

    std::vector<std::string> links;
    try {
        links = document->select(selector);
    } catch (const Extract::Query::SelectorSyntaxError& e) {
        Logger::error(e.what());
        return std::nullopt;
    }

    for (const auto& link : links) {
        std::string trimmed = Utils::Text::trim(link);
        if (trimmed.empty() || trimmed[0] == '#')
            continue;
        std::string resolved = Utils::Url::resolve(base, trimmed);
        if (Utils::Url::is_http_url(resolved))
            return resolved;
    }
    return std::nullopt;
}

std::optional<std::string> PaginationController::next_url(
    const Engine::Job::PageResult&       page,
    const Extract::Query::DocumentQuery* document,
    int                                  pages_so_far) {
    stop_reason_ = StopReason::None;
    visited_.insert(Utils::Url::normalize(page.url));
    if (page.document)
        visited_.insert(Utils::Url::normalize(page.document->base_url()));

    if (spec_.max_pages > 0 && pages_so_far >= spec_.max_pages) {
        stop_reason_ = StopReason::MaxPages;
        return std::nullopt;
    }
    if (spec_.strategy == PaginationStrategy::None) {
        stop_reason_ = StopReason::NoNextLink;
        return std::nullopt;
    }
    if (page.success && is_duplicate(page.record)) {
        stop_reason_ = StopReason::Duplicate;
        return std::nullopt;
    }
    if (document && !spec_.stop_selector.empty()) {
        try {
            if (document->exists(spec_.stop_selector)) {
                stop_reason_ = StopReason::StopSelector;
                return std::nullopt;
            }
        } catch (const Extract::Query::SelectorSyntaxError& e) {
            Logger::error(e.what());
        }
    }

    auto next = resolve_next(page, document, pages_so_far);
    if (!next) {
        stop_reason_ = StopReason::NoNextLink;
        return std::nullopt;
    }
    if (visited_.count(Utils::Url::normalize(*next))) {
        stop_reason_ = StopReason::Visited;
        return std::nullopt;
    }
    return next;
}

}  // namespace Pagination
}  // namespace Gleaner
