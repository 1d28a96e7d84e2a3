#include <gtest/gtest.h>
#include "../../src/extract/query/css_selector.hpp"
#include "../../src/extract/query/gumbo_query.hpp"

using namespace Gleaner::Extract::Query;

namespace {

const std::string LISTING = R"(
<html><head><title>Listing</title><script>var x = "<p class='item'>no</p>";</script></head>
<body>
  <div id="main" class="content wide">
    <article class="item featured" data-id="1"><h2>First</h2><a href="/a?page=1" rel="next">A</a></article>
    <article class="item" data-id="2"><h2>Second</h2><a href="https://cdn.test/b.png">B</a></article>
    <section><article class="item" data-id="3"><h2>Third<br>line</h2></article></section>
  </div>
  <footer><p lang="en-US">Footer</p></footer>
</body></html>)";

}  // namespace

TEST(SelectorParserTest, ParsesCompoundsAndCombinators) {
    auto sel = SelectorParser::parse("div#main.content > article.item[data-id='2'] h2::text");
    ASSERT_EQ(sel.groups.size(), 1u);

    const auto& complex = sel.groups[0];
    ASSERT_EQ(complex.parts.size(), 3u);
    EXPECT_EQ(complex.parts[0].tag, "div");
    EXPECT_EQ(complex.parts[0].id, "main");
    EXPECT_EQ(complex.parts[0].classes, std::vector<std::string>{"content"});
    EXPECT_EQ(complex.parts[1].attributes.size(), 1u);
    EXPECT_EQ(complex.parts[1].attributes[0].op, AttrOp::Equals);
    EXPECT_EQ(complex.parts[1].attributes[0].value, "2");
    ASSERT_EQ(complex.combinators.size(), 2u);
    EXPECT_EQ(complex.combinators[0], Combinator::Child);
    EXPECT_EQ(complex.combinators[1], Combinator::Descendant);
    EXPECT_EQ(complex.pseudo, PseudoElement::Text);
}

TEST(SelectorParserTest, AttrPseudoAndGroups) {
    auto sel = SelectorParser::parse("a::attr(href), img::attr(src)");
    ASSERT_EQ(sel.groups.size(), 2u);
    EXPECT_EQ(sel.groups[0].pseudo, PseudoElement::Attr);
    EXPECT_EQ(sel.groups[0].pseudo_arg, "href");
    EXPECT_EQ(sel.groups[1].pseudo_arg, "src");
}

TEST(SelectorParserTest, RejectsMalformed) {
    EXPECT_THROW(SelectorParser::parse(""), SelectorSyntaxError);
    EXPECT_THROW(SelectorParser::parse("div >"), SelectorSyntaxError);
    EXPECT_THROW(SelectorParser::parse("a[href"), SelectorSyntaxError);
    EXPECT_THROW(SelectorParser::parse("a::attr()"), SelectorSyntaxError);
    EXPECT_THROW(SelectorParser::parse("p::before"), SelectorSyntaxError);
    EXPECT_THROW(SelectorParser::parse("a,,b"), SelectorSyntaxError);
}

TEST(GumboQueryTest, TextInDocumentOrder) {
    GumboQuery doc(LISTING);
    auto       titles = doc.select("article.item h2");
    ASSERT_EQ(titles.size(), 3u);
    EXPECT_EQ(titles[0], "First");
    EXPECT_EQ(titles[1], "Second");
    EXPECT_EQ(titles[2], "Third\nline");
}

TEST(GumboQueryTest, ChildCombinatorIsStrict) {
    GumboQuery doc(LISTING);
    EXPECT_EQ(doc.select("#main > article").size(), 2u);
    EXPECT_EQ(doc.select("#main article").size(), 3u);
}

TEST(GumboQueryTest, AttributeOperators) {
    GumboQuery doc(LISTING);
    EXPECT_EQ(doc.select("article[data-id]").size(), 3u);
    EXPECT_EQ(doc.select("article[class~=featured] h2"), std::vector<std::string>{"First"});
    EXPECT_EQ(doc.select("a[href^=https]::attr(href)"),
              std::vector<std::string>{"https://cdn.test/b.png"});
    EXPECT_EQ(doc.select("a[href$='.png']").size(), 1u);
    EXPECT_EQ(doc.select("a[href*=page]::attr(rel)"), std::vector<std::string>{"next"});
    EXPECT_EQ(doc.select("p[lang=en-US]"), std::vector<std::string>{"Footer"});
}

TEST(GumboQueryTest, AttrSkipsElementsWithoutIt) {
    GumboQuery doc(LISTING);
    auto       rels = doc.select("a::attr(rel)");
    EXPECT_EQ(rels, std::vector<std::string>{"next"});
}

TEST(GumboQueryTest, ScriptContentIsNotText) {
    GumboQuery doc(LISTING);
    EXPECT_EQ(doc.select("p.item").size(), 0u);
    auto heads = doc.select("head");
    ASSERT_EQ(heads.size(), 1u);
    EXPECT_EQ(heads[0], "Listing");
}

TEST(GumboQueryTest, GroupsAndUniversal) {
    GumboQuery doc(LISTING);
    auto       values = doc.select("footer p, h2");
    ASSERT_EQ(values.size(), 4u);
    EXPECT_EQ(values.back(), "Footer");

    EXPECT_GE(doc.select("*").size(), 10u);
    EXPECT_TRUE(doc.exists("section > article"));
    EXPECT_FALSE(doc.exists("table"));
}

TEST(GumboQueryTest, HtmlPseudoSerializes) {
    GumboQuery doc("<div class=\"box\"><b>bold</b> &amp; <img src=\"x.png\"></div>");
    auto       html = doc.select("div.box::html");
    ASSERT_EQ(html.size(), 1u);
    EXPECT_EQ(html[0], "<div class=\"box\"><b>bold</b> &amp; <img src=\"x.png\"></div>");
}

TEST(GumboQueryTest, ParserProducesQuery) {
    GumboParser parser;
    auto        doc = parser.parse("<ul><li>a</li><li>b</li></ul>");
    EXPECT_EQ(doc->select("li"), (std::vector<std::string>{"a", "b"}));
    EXPECT_THROW(doc->select("li["), SelectorSyntaxError);
}
