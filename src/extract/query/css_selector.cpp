#include "css_selector.hpp"
#include <cctype>
#include "../../utils/text/string_utils.hpp"

namespace Gleaner {
namespace Extract {
namespace Query {

namespace {

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_'
           || static_cast<unsigned char>(c) >= 0x80;
}

class Cursor {
public:
    explicit Cursor(const std::string& text) : text_(text) {
    }

    bool eof() const {
        return pos_ >= text_.size();
    }

    char peek(size_t ahead = 0) const {
        return pos_ + ahead < text_.size() ? text_[pos_ + ahead] : '\0';
    }

    void advance(size_t n = 1) {
        pos_ += n;
    }

    // True when any whitespace was consumed.
    bool skip_ws() {
        size_t start = pos_;
        while (!eof() && std::isspace(static_cast<unsigned char>(text_[pos_])))
            ++pos_;
        return pos_ != start;
    }

    std::string ident() {
        size_t start = pos_;
        while (!eof() && is_ident_char(text_[pos_]))
            ++pos_;
        if (start == pos_)
            fail("expected identifier at offset " + std::to_string(start));
        return text_.substr(start, pos_ - start);
    }

    std::string value() {
        char quote = peek();
        if (quote != '"' && quote != '\'')
            return ident();

        advance();
        size_t start = pos_;
        while (!eof() && text_[pos_] != quote)
            ++pos_;
        if (eof())
            fail("unterminated string");
        std::string out = text_.substr(start, pos_ - start);
        advance();
        return out;
    }

    void expect(char c) {
        if (peek() != c)
            fail(std::string("expected '") + c + "' at offset " + std::to_string(pos_));
        advance();
    }

    [[noreturn]] void fail(const std::string& reason) const {
        throw SelectorSyntaxError(text_, reason);
    }

private:
    const std::string& text_;
    size_t             pos_ = 0;
};

AttrCondition parse_attribute(Cursor& cur) {
    AttrCondition cond;
    cur.expect('[');
    cur.skip_ws();
    cond.name = Utils::Text::to_lower(cur.ident());
    cur.skip_ws();

    if (cur.peek() == ']') {
        cur.advance();
        return cond;
    }

    char c = cur.peek();
    if (c == '=') {
        cond.op = AttrOp::Equals;
        cur.advance();
    }
    else if (cur.peek(1) == '=' && (c == '~' || c == '^' || c == '$' || c == '*')) {
        cond.op = c == '~' ? AttrOp::Includes
                  : c == '^' ? AttrOp::Prefix
                  : c == '$' ? AttrOp::Suffix
                             : AttrOp::Contains;
        cur.advance(2);
    }
    else {
        cur.fail("unsupported attribute operator");
    }

    cur.skip_ws();
    cond.value = cur.value();
    cur.skip_ws();
    cur.expect(']');
    return cond;
}

Compound parse_compound(Cursor& cur) {
    Compound compound;
    bool     any = false;

    if (cur.peek() == '*') {
        cur.advance();
        any = true;
    }
    else if (is_ident_char(cur.peek())) {
        compound.tag = Utils::Text::to_lower(cur.ident());
        any          = true;
    }

    while (true) {
        char c = cur.peek();
        if (c == '#') {
            cur.advance();
            compound.id = cur.ident();
        }
        else if (c == '.') {
            cur.advance();
            compound.classes.push_back(cur.ident());
        }
        else if (c == '[') {
            compound.attributes.push_back(parse_attribute(cur));
        }
        else {
            break;
        }
        any = true;
    }

    if (!any)
        cur.fail("expected a selector");
    return compound;
}

void parse_pseudo(Cursor& cur, ComplexSelector& complex) {
    cur.advance(2);
    std::string name = Utils::Text::to_lower(cur.ident());
    if (name == "text") {
        complex.pseudo = PseudoElement::Text;
    }
    else if (name == "html") {
        complex.pseudo = PseudoElement::Html;
    }
    else if (name == "attr") {
        complex.pseudo = PseudoElement::Attr;
        cur.expect('(');
        cur.skip_ws();
        complex.pseudo_arg = Utils::Text::to_lower(cur.value());
        cur.skip_ws();
        cur.expect(')');
    }
    else {
        cur.fail("unknown pseudo-element ::" + name);
    }
}

ComplexSelector parse_complex(Cursor& cur) {
    ComplexSelector complex;
    cur.skip_ws();
    complex.parts.push_back(parse_compound(cur));

    while (true) {
        bool spaced = cur.skip_ws();
        if (cur.eof() || cur.peek() == ',')
            break;

        if (cur.peek() == ':' && cur.peek(1) == ':') {
            if (spaced)
                cur.fail("pseudo-element must follow a selector");
            parse_pseudo(cur, complex);
            cur.skip_ws();
            if (!cur.eof() && cur.peek() != ',')
                cur.fail("pseudo-element must end the selector");
            break;
        }

        if (cur.peek() == '>') {
            cur.advance();
            cur.skip_ws();
            complex.combinators.push_back(Combinator::Child);
        }
        else if (spaced) {
            complex.combinators.push_back(Combinator::Descendant);
        }
        else {
            cur.fail(std::string("unexpected character '") + cur.peek() + "'");
        }
        complex.parts.push_back(parse_compound(cur));
    }
    return complex;
}

}  // namespace

Selector SelectorParser::parse(const std::string& selector) {
    Cursor cur(selector);
    cur.skip_ws();
    if (cur.eof())
        cur.fail("empty selector");

    Selector out;
    while (true) {
        out.groups.push_back(parse_complex(cur));
        cur.skip_ws();
        if (cur.eof())
            break;
        cur.expect(',');
    }
    return out;
}

}  // namespace Query
}  // namespace Extract
}  // namespace Gleaner
