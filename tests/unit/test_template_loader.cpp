#include <fstream>
#include <gtest/gtest.h>
#include "../../src/core/errors/errors.hpp"
#include "../../src/template/loader/template_loader.hpp"

using namespace Gleaner::Templates;
using Gleaner::Core::TemplateError;
using Gleaner::Network::Http::StealthLevel;

TEST(TemplateLoaderTest, FieldsLayout) {
    auto tpl = TemplateLoader::from_string(R"({
        "name": "products",
        "fields": [
            {"name": "title", "selector": "h1.title", "fallbacks": ["h1", ".name"], "required": true,
             "directives": ["trim", {"type": "replace", "pattern": "\\s+-\\s+Shop$", "replacement": ""}]},
            {"name": "price", "selector": ".price", "directives": ["number"]},
            {"name": "image", "selector": "img.main", "kind": "attribute", "attribute": "src"},
            {"name": "tags", "selector": "ul.tags li", "kind": "list", "non_empty": true}
        ],
        "pagination": {"next_selector": "a.next", "max_pages": 4},
        "fetch": {"stealth": "high", "min_delay_ms": 100, "max_delay_ms": 300,
                  "headers": {"Accept-Language": "en"}, "render_js": true},
        "abort_on_required_failure": true
    })");

    EXPECT_EQ(tpl.name, "products");
    ASSERT_EQ(tpl.fields.size(), 4u);

    const auto& title = tpl.fields[0];
    EXPECT_TRUE(title.required);
    ASSERT_EQ(title.fallbacks.size(), 2u);
    EXPECT_EQ(title.fallbacks[1], ".name");
    ASSERT_EQ(title.directives.size(), 2u);
    EXPECT_EQ(title.directives[1].type, DirectiveType::Replace);

    EXPECT_EQ(tpl.fields[1].directives[0].type, DirectiveType::Number);
    EXPECT_EQ(tpl.fields[2].kind, FieldKind::Attribute);
    EXPECT_EQ(tpl.fields[2].attribute, "src");
    EXPECT_EQ(tpl.fields[3].kind, FieldKind::Collection);
    EXPECT_TRUE(tpl.fields[3].non_empty);

    EXPECT_EQ(tpl.pagination.strategy, PaginationStrategy::NextLink);
    EXPECT_EQ(tpl.pagination.max_pages, 4);

    EXPECT_EQ(tpl.profile.stealth, StealthLevel::High);
    EXPECT_EQ(tpl.profile.min_delay.count(), 100);
    EXPECT_EQ(tpl.profile.max_delay.count(), 300);
    EXPECT_EQ(tpl.profile.headers.at("Accept-Language"), "en");
    EXPECT_TRUE(tpl.profile.render_js);
    EXPECT_TRUE(tpl.abort_on_required_failure);
    EXPECT_FALSE(tpl.discovery.has_value());
}

TEST(TemplateLoaderTest, SelectorMapLayout) {
    auto tpl = TemplateLoader::from_string(R"json({
        "name": "legacy",
        "selectors": {
            "title": "h1",
            "link": {"selector": "a.more::attr(href)", "kind": "attribute"}
        },
        "fallback_selectors": {"title": [".headline", "h2"]},
        "validation_rules": {"required_fields": ["title"]},
        "post_processing": [{"type": "strip", "field": "title"}, {"type": "url", "field": "link"}]
    })json");

    ASSERT_EQ(tpl.fields.size(), 2u);
    const FieldSpec* title = nullptr;
    const FieldSpec* link  = nullptr;
    for (const auto& field : tpl.fields) {
        if (field.name == "title")
            title = &field;
        if (field.name == "link")
            link = &field;
    }
    ASSERT_NE(title, nullptr);
    ASSERT_NE(link, nullptr);

    EXPECT_TRUE(title->required);
    EXPECT_EQ(title->fallbacks.size(), 2u);
    ASSERT_EQ(title->directives.size(), 1u);
    EXPECT_EQ(title->directives[0].type, DirectiveType::Trim);

    EXPECT_FALSE(link->required);
    EXPECT_EQ(link->kind, FieldKind::Attribute);
    ASSERT_EQ(link->directives.size(), 1u);
    EXPECT_EQ(link->directives[0].type, DirectiveType::NormalizeUrl);
}

TEST(TemplateLoaderTest, SelectorMapKeepsDeclarationOrder) {
    auto tpl = TemplateLoader::from_string(
        R"({"selectors": {"title": "h1", "price": ".p", "brand": ".b", "availability": ".stock"}})");

    ASSERT_EQ(tpl.fields.size(), 4u);
    EXPECT_EQ(tpl.fields[0].name, "title");
    EXPECT_EQ(tpl.fields[1].name, "price");
    EXPECT_EQ(tpl.fields[2].name, "brand");
    EXPECT_EQ(tpl.fields[3].name, "availability");
}

TEST(TemplateLoaderTest, ValidationRules) {
    auto tpl = TemplateLoader::from_string(R"({
        "selectors": {"sku": ".sku", "tags": {"selector": "li", "kind": "list"}},
        "validation_rules": {
            "required_fields": ["sku"],
            "field_types": {"tags": "list"},
            "field_patterns": {"sku": "[A-Z]{2}-\\d+"}
        }
    })");
    ASSERT_EQ(tpl.fields.size(), 2u);
    EXPECT_EQ(tpl.fields[0].pattern, "[A-Z]{2}-\\d+");
    EXPECT_TRUE(tpl.fields[0].value_type.empty());
    EXPECT_EQ(tpl.fields[1].value_type, "list");

    auto fields = TemplateLoader::from_string(
        R"({"fields": [{"name": "price", "selector": ".p", "value_type": "number", "pattern": "\\d"}]})");
    EXPECT_EQ(fields.fields[0].value_type, "number");
    EXPECT_EQ(fields.fields[0].pattern, "\\d");

    EXPECT_THROW(TemplateLoader::from_string(
                     R"({"selectors": {"a": "p"}, "validation_rules": {"min_length": {"a": 3}}})"),
                 TemplateError);
    EXPECT_THROW(TemplateLoader::from_string(
                     R"({"selectors": {"a": "p"}, "validation_rules": {"field_types": {"b": "string"}}})"),
                 TemplateError);
    EXPECT_THROW(TemplateLoader::from_string(
                     R"({"selectors": {"a": "p"}, "validation_rules": {"field_types": {"a": "date"}}})"),
                 TemplateError);
    EXPECT_THROW(TemplateLoader::from_string(
                     R"({"selectors": {"a": "p"}, "validation_rules": {"field_patterns": {"a": "(["}}})"),
                 TemplateError);
    EXPECT_THROW(TemplateLoader::from_string(
                     R"({"selectors": {"a": "p"}, "validation_rules": {"field_types": {"a": 4}}})"),
                 TemplateError);
}

TEST(TemplateLoaderTest, PaginationDefaults) {
    auto none = TemplateLoader::from_string(R"({"fields": [{"name": "a", "selector": "p"}]})");
    EXPECT_EQ(none.name, "unnamed");
    EXPECT_EQ(none.pagination.strategy, PaginationStrategy::None);

    auto by_page = TemplateLoader::from_string(R"({
        "fields": [{"name": "a", "selector": "p"}],
        "pagination": {"url_pattern": "https://shop.test/list?page={page}", "start_page": 0}
    })");
    EXPECT_EQ(by_page.pagination.strategy, PaginationStrategy::PageParameter);
    EXPECT_EQ(by_page.pagination.start_page, 0);
}

TEST(TemplateLoaderTest, Discovery) {
    auto tpl = TemplateLoader::from_string(R"({
        "fields": [{"name": "a", "selector": "p"}],
        "discovery": {"link_selector": "a.category", "max_seeds": 5, "same_domain": false}
    })");
    ASSERT_TRUE(tpl.discovery.has_value());
    EXPECT_EQ(tpl.discovery->link_selector, "a.category");
    EXPECT_EQ(tpl.discovery->max_seeds, 5u);
    EXPECT_FALSE(tpl.discovery->same_domain);
}

TEST(TemplateLoaderTest, RejectsBrokenTemplates) {
    EXPECT_THROW(TemplateLoader::from_string("{not json"), TemplateError);
    EXPECT_THROW(TemplateLoader::from_string("[]"), TemplateError);
    EXPECT_THROW(TemplateLoader::from_string(R"({"name": "empty"})"), TemplateError);
    EXPECT_THROW(TemplateLoader::from_string(R"({"fields": [{"selector": "p"}]})"), TemplateError);
    EXPECT_THROW(TemplateLoader::from_string(R"({"fields": [{"name": "a", "selector": "p["}]})"),
                 TemplateError);
    EXPECT_THROW(TemplateLoader::from_string(
                     R"({"fields": [{"name": "a", "selector": "p", "fallbacks": ["div >"]}]})"),
                 TemplateError);
    EXPECT_THROW(
        TemplateLoader::from_string(R"({"fields": [{"name": "a", "selector": "img", "kind": "attribute"}]})"),
        TemplateError);
    EXPECT_THROW(TemplateLoader::from_string(
                     R"({"fields": [{"name": "a", "selector": "p", "kind": "table"}]})"),
                 TemplateError);
    EXPECT_THROW(TemplateLoader::from_string(
                     R"({"fields": [{"name": "a", "selector": "p", "directives": ["reverse"]}]})"),
                 TemplateError);
    EXPECT_THROW(
        TemplateLoader::from_string(
            R"({"fields": [{"name": "a", "selector": "p", "directives": [{"type": "replace", "pattern": "(["}]}]})"),
        TemplateError);
    EXPECT_THROW(TemplateLoader::from_string(
                     R"({"fields": [{"name": "a", "selector": "p"}], "pagination": {"strategy": "next_link"}})"),
                 TemplateError);
    EXPECT_THROW(
        TemplateLoader::from_string(
            R"({"fields": [{"name": "a", "selector": "p"}], "pagination": {"strategy": "page", "url_pattern": "/list"}})"),
        TemplateError);
    EXPECT_THROW(TemplateLoader::from_string(
                     R"({"fields": [{"name": "a", "selector": "p"}], "pagination": {"max_pages": -1}})"),
                 TemplateError);
    EXPECT_THROW(TemplateLoader::from_string(
                     R"({"fields": [{"name": "a", "selector": "p"}], "fetch": {"min_delay_ms": 500, "max_delay_ms": 100}})"),
                 TemplateError);
    EXPECT_THROW(TemplateLoader::from_string(
                     R"({"fields": [{"name": "a", "selector": "p"}], "fetch": {"stealth": "ninja"}})"),
                 TemplateError);
    EXPECT_THROW(TemplateLoader::from_string(R"({"fields": [{"name": 5, "selector": "p"}]})"),
                 TemplateError);
}

TEST(TemplateLoaderTest, LoadFile) {
    std::ofstream ofs("test_template.json");
    ofs << R"({"name": "file", "fields": [{"name": "title", "selector": "h1"}]})";
    ofs.close();

    auto tpl = TemplateLoader::load_file("test_template.json");
    ASSERT_NE(tpl, nullptr);
    EXPECT_EQ(tpl->name, "file");

    std::remove("test_template.json");
    EXPECT_THROW(TemplateLoader::load_file("test_template.json"), TemplateError);
}

TEST(TemplateLoaderTest, Aliases) {
    EXPECT_EQ(TemplateLoader::parse_kind("ATTR"), FieldKind::Attribute);
    EXPECT_EQ(TemplateLoader::parse_kind("html"), FieldKind::Html);
    EXPECT_EQ(TemplateLoader::parse_strategy("next"), PaginationStrategy::NextLink);
    EXPECT_EQ(TemplateLoader::parse_stealth("off"), StealthLevel::None);
    EXPECT_EQ(TemplateLoader::parse_directive("collapse_whitespace").type, DirectiveType::Collapse);
    EXPECT_EQ(TemplateLoader::parse_directive(nlohmann::ordered_json::parse(R"({"type": "join", "separator": ", "})"))
                  .separator,
              ", ");
    EXPECT_THROW(TemplateLoader::parse_directive(nlohmann::ordered_json(3)), TemplateError);
}
