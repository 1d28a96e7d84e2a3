#pragma once
#include <optional>
#include <string>
#include <vector>
#include "../../core/types/constants.hpp"
#include "../../network/http/fetcher.hpp"

namespace Gleaner {
namespace Templates {

enum class FieldKind { Text, Attribute, Collection, Html };

enum class DirectiveType { Trim, Collapse, Lower, Upper, Number, NormalizeUrl, Replace, Split, Join };

struct Directive {
    DirectiveType type = DirectiveType::Trim;
    std::string   pattern;      // Replace
    std::string   replacement;  // Replace
    std::string   separator;    // Split, Join
};

struct FieldSpec {
    std::string              name;
    std::string              selector;
    std::vector<std::string> fallbacks;
    FieldKind                kind = FieldKind::Text;
    std::string              attribute;  // Attribute kind without an explicit ::attr()
    bool                     required    = false;
    bool                     allow_empty = false;
    bool                     non_empty   = false;  // Collection only
    std::vector<Directive>   directives;

    // Checked after post-processing; a value failing either is not usable.
    std::string value_type;  // empty, "string", "number", "list" or "dict"
    std::string pattern;     // regex anchored at the start of the value
};

enum class PaginationStrategy { None, NextLink, PageParameter };

struct PaginationSpec {
    PaginationStrategy strategy = PaginationStrategy::None;
    std::string        next_selector;
    std::string        url_pattern;  // contains "{page}"
    int                start_page = 1;
    int                max_pages  = Core::Constants::DEFAULT_MAX_PAGES;  // 0 = unbounded
    std::string        stop_selector;
    size_t             duplicate_window     = Core::Constants::DEFAULT_DUPLICATE_WINDOW;
    double             similarity_threshold = 0.9;
};

// Optional first step that turns the start page into several seed URLs,
// each of which is scraped as its own page chain.
struct DiscoverySpec {
    std::string link_selector;
    size_t      max_seeds   = 0;  // 0 = all
    bool        same_domain = true;
};

struct Template {
    std::string                  name;
    std::vector<FieldSpec>       fields;
    PaginationSpec               pagination;
    Network::Http::FetchProfile  profile;
    std::optional<DiscoverySpec> discovery;
    bool                         abort_on_required_failure = false;
};

const char* to_string(FieldKind kind);
const char* to_string(DirectiveType type);
const char* to_string(PaginationStrategy strategy);

}  // namespace Templates
}  // namespace Gleaner
