#pragma once
#include <memory>
#include <string>
#include <vector>

namespace Gleaner {
namespace Extract {
namespace Query {

// Read-only view of one parsed document.
class DocumentQuery {
public:
    virtual ~DocumentQuery() = default;

    /**
     * Returns one value per matched element, in document order. By default
     * the value is the element's text; ::attr(name) yields the attribute
     * (elements without it are skipped) and ::html the element's markup.
     *
     * @throws SelectorSyntaxError on a malformed selector.
     */
    virtual std::vector<std::string> select(const std::string& selector) const = 0;

    virtual bool exists(const std::string& selector) const {
        return !select(selector).empty();
    }
};

class DocumentParser {
public:
    virtual ~DocumentParser() = default;

    virtual std::unique_ptr<DocumentQuery> parse(const std::string& html) const = 0;
};

}  // namespace Query
}  // namespace Extract
}  // namespace Gleaner
