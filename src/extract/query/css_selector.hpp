#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace Gleaner {
namespace Extract {
namespace Query {

enum class AttrOp { Exists, Equals, Includes, Prefix, Suffix, Contains };

struct AttrCondition {
    std::string name;
    AttrOp      op = AttrOp::Exists;
    std::string value;
};

// One element test: tag, #id, .classes and [attribute] conditions.
struct Compound {
    std::string                tag;  // empty matches any element
    std::string                id;
    std::vector<std::string>   classes;
    std::vector<AttrCondition> attributes;
};

enum class Combinator { Descendant, Child };

enum class PseudoElement { None, Text, Attr, Html };

// Compounds joined by combinators; combinators[i] sits between parts[i] and
// parts[i + 1]. The pseudo-element picks what a match yields.
struct ComplexSelector {
    std::vector<Compound>   parts;
    std::vector<Combinator> combinators;
    PseudoElement           pseudo = PseudoElement::None;
    std::string             pseudo_arg;
};

// Comma separated group.
struct Selector {
    std::vector<ComplexSelector> groups;
};

class SelectorSyntaxError : public std::invalid_argument {
public:
    SelectorSyntaxError(const std::string& selector, const std::string& reason)
        : std::invalid_argument("Invalid selector '" + selector + "': " + reason) {
    }
};

class SelectorParser {
public:
    /**
     * @brief Parses the supported CSS subset.
     *
     * Type, universal, #id, .class and [attr], [attr=v], [attr~=v],
     * [attr^=v], [attr$=v], [attr*=v]; descendant and '>' combinators;
     * comma groups; trailing ::text, ::attr(name) or ::html.
     *
     * @throws SelectorSyntaxError
     */
    static Selector parse(const std::string& selector);
};

}  // namespace Query
}  // namespace Extract
}  // namespace Gleaner
