#include "gumbo_query.hpp"
#include <functional>
#include "../../utils/text/string_utils.hpp"

namespace Gleaner {
namespace Extract {
namespace Query {

namespace {

using Utils::Text::to_lower;

std::string tag_name(const GumboNode* node) {
    const GumboElement& el = node->v.element;
    if (el.tag != GUMBO_TAG_UNKNOWN)
        return gumbo_normalized_tagname(el.tag);

    GumboStringPiece piece = el.original_tag;
    gumbo_tag_from_original_text(&piece);
    std::string name(piece.data, piece.length);
    auto        end = name.find_first_of(" \t\r\n/>");
    return to_lower(end == std::string::npos ? name : name.substr(0, end));
}

const char* attribute(const GumboNode* node, const std::string& name) {
    const GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, name.c_str());
    return attr ? attr->value : nullptr;
}

bool has_word(const std::string& list, const std::string& word) {
    size_t pos = 0;
    while (pos < list.size()) {
        auto start = list.find_first_not_of(" \t\r\n\f", pos);
        if (start == std::string::npos)
            break;
        auto end = list.find_first_of(" \t\r\n\f", start);
        if (end == std::string::npos)
            end = list.size();
        if (list.compare(start, end - start, word) == 0)
            return true;
        pos = end;
    }
    return false;
}

bool match_attribute(const GumboNode* node, const AttrCondition& cond) {
    const char* raw = attribute(node, cond.name);
    if (!raw)
        return false;

    std::string value(raw);
    switch (cond.op) {
        case AttrOp::Exists: return true;
        case AttrOp::Equals: return value == cond.value;
        case AttrOp::Includes: return has_word(value, cond.value);
        case AttrOp::Prefix: return !cond.value.empty() && Utils::Text::starts_with(value, cond.value);
        case AttrOp::Suffix: return !cond.value.empty() && Utils::Text::ends_with(value, cond.value);
        case AttrOp::Contains: return !cond.value.empty() && value.find(cond.value) != std::string::npos;
    }
    return false;
}

bool match_compound(const GumboNode* node, const Compound& compound) {
    if (node->type != GUMBO_NODE_ELEMENT)
        return false;
    if (!compound.tag.empty() && tag_name(node) != compound.tag)
        return false;
    if (!compound.id.empty()) {
        const char* id = attribute(node, "id");
        if (!id || compound.id != id)
            return false;
    }
    if (!compound.classes.empty()) {
        const char* cls = attribute(node, "class");
        if (!cls)
            return false;
        for (const auto& name : compound.classes) {
            if (!has_word(cls, name))
                return false;
        }
    }
    for (const auto& cond : compound.attributes) {
        if (!match_attribute(node, cond))
            return false;
    }
    return true;
}

bool is_element(const GumboNode* node) {
    return node && node->type == GUMBO_NODE_ELEMENT;
}

// Right-to-left match of parts[0..idx] ending at node.
bool match_from(const ComplexSelector& sel, size_t idx, const GumboNode* node) {
    if (!match_compound(node, sel.parts[idx]))
        return false;
    if (idx == 0)
        return true;

    const GumboNode* parent = node->parent;
    if (sel.combinators[idx - 1] == Combinator::Child)
        return is_element(parent) && match_from(sel, idx - 1, parent);

    for (; is_element(parent); parent = parent->parent) {
        if (match_from(sel, idx - 1, parent))
            return true;
    }
    return false;
}

void append_text(const GumboNode* node, std::string& out) {
    switch (node->type) {
        case GUMBO_NODE_TEXT:
        case GUMBO_NODE_WHITESPACE:
        case GUMBO_NODE_CDATA: out += node->v.text.text; break;
        case GUMBO_NODE_ELEMENT:
        case GUMBO_NODE_TEMPLATE: {
            GumboTag tag = node->v.element.tag;
            if (tag == GUMBO_TAG_SCRIPT || tag == GUMBO_TAG_STYLE || tag == GUMBO_TAG_NOSCRIPT)
                return;
            if (tag == GUMBO_TAG_BR)
                out += '\n';
            const GumboVector& children = node->v.element.children;
            for (unsigned int i = 0; i < children.length; ++i)
                append_text(static_cast<const GumboNode*>(children.data[i]), out);
            break;
        }
        default: break;
    }
}

std::string escape(const std::string& text, bool attribute_value) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += attribute_value ? "<" : "&lt;"; break;
            case '>': out += attribute_value ? ">" : "&gt;"; break;
            case '"': out += attribute_value ? "&quot;" : "\""; break;
            default: out += c;
        }
    }
    return out;
}

bool is_void(GumboTag tag) {
    switch (tag) {
        case GUMBO_TAG_AREA:
        case GUMBO_TAG_BASE:
        case GUMBO_TAG_BR:
        case GUMBO_TAG_COL:
        case GUMBO_TAG_EMBED:
        case GUMBO_TAG_HR:
        case GUMBO_TAG_IMG:
        case GUMBO_TAG_INPUT:
        case GUMBO_TAG_LINK:
        case GUMBO_TAG_META:
        case GUMBO_TAG_PARAM:
        case GUMBO_TAG_SOURCE:
        case GUMBO_TAG_TRACK:
        case GUMBO_TAG_WBR: return true;
        default: return false;
    }
}

void append_html(const GumboNode* node, std::string& out) {
    switch (node->type) {
        case GUMBO_NODE_TEXT:
        case GUMBO_NODE_WHITESPACE: out += escape(node->v.text.text, false); break;
        case GUMBO_NODE_CDATA: out += std::string("<![CDATA[") + node->v.text.text + "]]>"; break;
        case GUMBO_NODE_COMMENT: out += std::string("<!--") + node->v.text.text + "-->"; break;
        case GUMBO_NODE_ELEMENT:
        case GUMBO_NODE_TEMPLATE: {
            const GumboElement& el   = node->v.element;
            std::string         name = tag_name(node);
            out += "<" + name;
            for (unsigned int i = 0; i < el.attributes.length; ++i) {
                auto* attr = static_cast<const GumboAttribute*>(el.attributes.data[i]);
                out += " " + std::string(attr->name) + "=\"" + escape(attr->value, true) + "\"";
            }
            out += ">";
            if (is_void(el.tag))
                return;
            bool raw = el.tag == GUMBO_TAG_SCRIPT || el.tag == GUMBO_TAG_STYLE;
            for (unsigned int i = 0; i < el.children.length; ++i) {
                auto* child = static_cast<const GumboNode*>(el.children.data[i]);
                if (raw && child->type == GUMBO_NODE_TEXT)
                    out += child->v.text.text;
                else
                    append_html(child, out);
            }
            out += "</" + name + ">";
            break;
        }
        default: break;
    }
}

std::string extract_value(const GumboNode* node, const ComplexSelector& sel, bool& present) {
    present = true;
    switch (sel.pseudo) {
        case PseudoElement::Attr: {
            const char* value = attribute(node, sel.pseudo_arg);
            present           = value != nullptr;
            return value ? value : "";
        }
        case PseudoElement::Html: {
            std::string out;
            append_html(node, out);
            return out;
        }
        case PseudoElement::None:
        case PseudoElement::Text: break;
    }
    std::string out;
    append_text(node, out);
    return out;
}

void walk(const GumboNode* node, const std::function<void(const GumboNode*)>& visit) {
    if (!is_element(node) && node->type != GUMBO_NODE_TEMPLATE)
        return;
    visit(node);
    const GumboVector& children = node->v.element.children;
    for (unsigned int i = 0; i < children.length; ++i)
        walk(static_cast<const GumboNode*>(children.data[i]), visit);
}

}  // namespace

GumboQuery::GumboQuery(std::string html) : html_(std::move(html)) {
    output_ = gumbo_parse_with_options(&kGumboDefaultOptions, html_.data(), html_.size());
}

GumboQuery::~GumboQuery() {
    if (output_)
        gumbo_destroy_output(&kGumboDefaultOptions, output_);
}

std::vector<std::string> GumboQuery::select(const std::string& selector) const {
    Selector                 parsed = SelectorParser::parse(selector);
    std::vector<std::string> values;

    walk(output_->root, [&](const GumboNode* node) {
        for (const auto& group : parsed.groups) {
            if (!match_from(group, group.parts.size() - 1, node))
                continue;
            bool present = false;
            auto value   = extract_value(node, group, present);
            if (present)
                values.push_back(std::move(value));
            break;
        }
    });
    return values;
}

std::unique_ptr<DocumentQuery> GumboParser::parse(const std::string& html) const {
    return std::make_unique<GumboQuery>(html);
}

}  // namespace Query
}  // namespace Extract
}  // namespace Gleaner
