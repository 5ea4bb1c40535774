/**
 * @file test_template.cpp
 * @brief Template engine: substitution, loops, conditionals, whitespace control
 */

#include "semverpp/changelog.hpp"

#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace semverpp::changelog::test {

namespace {

[[nodiscard]] std::string render(std::string_view source, const nlohmann::json& context)
{
    auto result = render_template(source, context);
    EXPECT_TRUE(result) << (result ? "" : result.error().message);
    return result ? *result : std::string{};
}

[[nodiscard]] Error render_error(std::string_view source, const nlohmann::json& context = {})
{
    auto result = render_template(source, context);
    EXPECT_FALSE(result) << "expected an error for: " << source;
    return result ? Error{} : result.error();
}

}  // namespace

TEST(TemplateTest, PlainTextPassesThrough)
{
    EXPECT_EQ(render("no tags { here }\n", nlohmann::json::object()), "no tags { here }\n");
}

TEST(TemplateTest, SubstitutesDottedPaths)
{
    const nlohmann::json context = {
        {"release", {{"version", "1.2.0"}, {"count", 3}, {"created_at", nullptr}}}
    };
    EXPECT_EQ(render("v{{ release.version }} ({{release.count}})[{{ release.created_at }}]", context),
              "v1.2.0 (3)[]");
    EXPECT_EQ(render("[{{ release.missing.deeper }}]", context), "[]");
    EXPECT_EQ(render("{{ 'quoted' }}", context), "quoted");
}

TEST(TemplateTest, LoopsWithTrimBlocks)
{
    const nlohmann::json context = {
        {"items", {"a", "b", "c"}}
    };
    EXPECT_EQ(render("{% for item in items %}\n- {{ item }}\n{% endfor %}\n", context),
              "- a\n- b\n- c\n");
}

TEST(TemplateTest, LoopVariables)
{
    const nlohmann::json context = {
        {"items", {"a", "b", "c"}}
    };
    EXPECT_EQ(render("{% for item in items %}{{ loop.index }}{{ item }}"
                     "{% if not loop.last %},{% endif %}{% endfor %}",
                     context),
              "1a,2b,3c");
}

TEST(TemplateTest, LoopOverObjectItems)
{
    const nlohmann::json context = {
        {"attributes", {{"b", "2"}, {"a", "1"}}}
    };
    EXPECT_EQ(render("{% for key, value in attributes %}{{ key }}={{ value }};{% endfor %}", context),
              "a=1;b=2;");
}

TEST(TemplateTest, LoopElseOnEmpty)
{
    const nlohmann::json context = {
        {"items", nlohmann::json::array()}
    };
    EXPECT_EQ(render("{% for item in items %}{{ item }}{% else %}none{% endfor %}", context),
              "none");
}

TEST(TemplateTest, ConditionalsFollowTruthiness)
{
    const nlohmann::json context = {
        { "empty",                           ""},
        {  "full",                          "x"},
        {  "zero",                            0},
        {  "list", nlohmann::json::array({1})},
        {  "none",                      nullptr},
        {"falsey",                        false}
    };
    EXPECT_EQ(render("{% if empty %}T{% else %}F{% endif %}", context), "F");
    EXPECT_EQ(render("{% if full %}T{% else %}F{% endif %}", context), "T");
    EXPECT_EQ(render("{% if zero %}T{% else %}F{% endif %}", context), "F");
    EXPECT_EQ(render("{% if list %}T{% else %}F{% endif %}", context), "T");
    EXPECT_EQ(render("{% if none %}T{% else %}F{% endif %}", context), "F");
    EXPECT_EQ(render("{% if not falsey %}T{% else %}F{% endif %}", context), "T");
    EXPECT_EQ(render("{% if missing %}T{% endif %}", context), "");
}

TEST(TemplateTest, ElifChains)
{
    const std::string source = "{% if a %}A{% elif b %}B{% else %}C{% endif %}";
    EXPECT_EQ(render(source, {{"a", true}, {"b", true}}), "A");
    EXPECT_EQ(render(source, {{"a", false}, {"b", true}}), "B");
    EXPECT_EQ(render(source, {{"a", false}, {"b", false}}), "C");
}

TEST(TemplateTest, CommentsAreDropped)
{
    EXPECT_EQ(render("a{# note #}b\n{# line #}\nc", nlohmann::json::object()), "ab\nc");
}

TEST(TemplateTest, WhitespaceControl)
{
    const nlohmann::json context = {
        {"items", {"a", "b"}}
    };
    EXPECT_EQ(render("[\n  {%- for item in items -%}\n  {{ item }}\n  {%- endfor -%}\n]", context),
              "[ab]");
}

TEST(TemplateTest, MalformedTemplatesAreErrors)
{
    EXPECT_EQ(render_error("{{ unterminated").code, error_code::kTemplateError);
    EXPECT_EQ(render_error("{% for x in xs %}no end").code, error_code::kTemplateError);
    EXPECT_EQ(render_error("{% if x %}no end").code, error_code::kTemplateError);
    EXPECT_EQ(render_error("{% endfor %}").code, error_code::kTemplateError);
    EXPECT_EQ(render_error("{% include 'x' %}").code, error_code::kTemplateError);
    EXPECT_EQ(render_error("{{ a b }}").code, error_code::kTemplateError);
    EXPECT_EQ(render_error("{% for x in value %}{% endfor %}", {{"value", "text"}}).code,
              error_code::kTemplateError);
}

TEST(TemplateTest, OperatorsAndCallsAreNotExpressions)
{
    const nlohmann::json context = {
        {"release", {{"created_at", "2024-01-02T00:00:00Z"}}}
    };
    const Error concat = render_error("{{ ' (' + release.created_at + ')' }}", context);
    EXPECT_EQ(concat.code, error_code::kTemplateError);
    EXPECT_NE(concat.message.find("invalid expression"), std::string::npos) << concat.message;

    EXPECT_EQ(render_error("{{ release.created_at if release.created_at }}", context).code,
              error_code::kTemplateError);
    EXPECT_EQ(render_error("{{ release.created_at.strftime('%Y') }}", context).code,
              error_code::kTemplateError);

    // The supported spelling of an optional date.
    EXPECT_EQ(render("{% if release.created_at %} ({{ release.created_at }}){% endif %}", context),
              " (2024-01-02T00:00:00Z)");
}

TEST(TemplateTest, ErrorsReportLineNumbers)
{
    const Error error = render_error("line one\nline two\n{% bogus %}\n");
    EXPECT_NE(error.message.find("line 3"), std::string::npos) << error.message;
}

}  // namespace semverpp::changelog::test
