#include "template.hpp"

namespace Gleaner {
namespace Templates {

const char* to_string(FieldKind kind) {
    switch (kind) {
        case FieldKind::Text: return "text";
        case FieldKind::Attribute: return "attribute";
        case FieldKind::Collection: return "collection";
        case FieldKind::Html: return "html";
    }
    return "unknown";
}

const char* to_string(DirectiveType type) {
    switch (type) {
        case DirectiveType::Trim: return "trim";
        case DirectiveType::Collapse: return "collapse";
        case DirectiveType::Lower: return "lower";
        case DirectiveType::Upper: return "upper";
        case DirectiveType::Number: return "number";
        case DirectiveType::NormalizeUrl: return "normalize_url";
        case DirectiveType::Replace: return "replace";
        case DirectiveType::Split: return "split";
        case DirectiveType::Join: return "join";
    }
    return "unknown";
}

const char* to_string(PaginationStrategy strategy) {
    switch (strategy) {
        case PaginationStrategy::None: return "none";
        case PaginationStrategy::NextLink: return "next_link";
        case PaginationStrategy::PageParameter: return "page_parameter";
    }
    return "unknown";
}

}  // namespace Templates
}  // namespace Gleaner
