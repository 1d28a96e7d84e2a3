#pragma once
#include <deque>
#include <optional>
#include <set>
#include <string>
#include "../engine/job/page_result.hpp"
#include "../extract/query/document_query.hpp"
#include "../template/model/template.hpp"

namespace Gleaner {
namespace Pagination {

enum class StopReason { None, MaxPages, Duplicate, StopSelector, Visited, NoNextLink };

const char* to_string(StopReason reason);

// Token-set Jaccard similarity over the scalar values of two records.
double record_similarity(const Extract::Engine::Record& a, const Extract::Engine::Record& b);

/**
 * @brief Decides the next URL of one page chain.
 *
 * Keeps the chain's visited set and a rolling window of recent records, so
 * one controller must be used per chain.
 */
class PaginationController {
public:
    explicit PaginationController(Templates::PaginationSpec spec);

    /**
     * @param document Parsed page, or nullptr when the page failed to fetch.
     * @param pages_so_far Pages processed in this chain, including @p page.
     * @return The absolute next URL, or nullopt to stop (see stop_reason()).
     */
    std::optional<std::string> next_url(const Engine::Job::PageResult& page,
                                        const Extract::Query::DocumentQuery* document,
                                        int                              pages_so_far);

    StopReason stop_reason() const {
        return stop_reason_;
    }

private:
    bool                       is_duplicate(const Extract::Engine::Record& record);
    std::optional<std::string> resolve_next(const Engine::Job::PageResult&       page,
                                            const Extract::Query::DocumentQuery* document,
                                            int                                  pages_so_far) const;

    Templates::PaginationSpec               spec_;
    std::set<std::string>                   visited_;
    std::deque<Extract::Engine::Record>     window_;
    StopReason                              stop_reason_ = StopReason::None;
};

}  // namespace Pagination
}  // namespace Gleaner
