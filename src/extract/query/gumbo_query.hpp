#pragma once
#include <gumbo.h>
#include <string>
#include "css_selector.hpp"
#include "document_query.hpp"

namespace Gleaner {
namespace Extract {
namespace Query {

class GumboQuery : public DocumentQuery {
public:
    explicit GumboQuery(std::string html);
    ~GumboQuery() override;

    GumboQuery(const GumboQuery&)            = delete;
    GumboQuery& operator=(const GumboQuery&) = delete;

    std::vector<std::string> select(const std::string& selector) const override;

private:
    // gumbo keeps pointers into the source buffer.
    std::string  html_;
    GumboOutput* output_ = nullptr;
};

class GumboParser : public DocumentParser {
public:
    std::unique_ptr<DocumentQuery> parse(const std::string& html) const override;
};

}  // namespace Query
}  // namespace Extract
}  // namespace Gleaner
