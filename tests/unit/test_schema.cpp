#include <gtest/gtest.h>
#include "toolwire/schema.hpp"
#include "toolwire/error.hpp"
#include <limits>

using namespace toolwire;
using nlohmann::json;

namespace {

const json kPerson = {
    {"type", "object"},
    {"properties", {
        {"name", {{"type", "string"}, {"minLength", 1}, {"maxLength", 8}}},
        {"age", {{"type", "integer"}, {"minimum", 0}, {"exclusiveMaximum", 150}}},
        {"tags", {{"type", "array"}, {"items", {{"type", "string"}}}, {"maxItems", 2}}},
        {"role", {{"enum", {"admin", "user"}}}}
    }},
    {"required", {"name", "age"}},
    {"additionalProperties", false}
};

} // namespace

TEST(Schema, AcceptsValidInstance) {
    json inst = {{"name", "ada"}, {"age", 36}, {"tags", {"x"}}, {"role", "admin"}};
    EXPECT_TRUE(schema::collect_errors(kPerson, inst).empty());
    EXPECT_NO_THROW(schema::validate(kPerson, inst));
}

TEST(Schema, CollectsEveryViolationWithPointer) {
    json inst = {{"name", ""}, {"age", -1}, {"tags", {"a", 2, "c"}}, {"extra", true}};
    auto errors = schema::collect_errors(kPerson, inst);

    auto has = [&errors](const std::string& prefix) {
        for (const auto& e : errors) {
            if (e.rfind(prefix, 0) == 0) return true;
        }
        return false;
    };
    EXPECT_TRUE(has("/name: "));
    EXPECT_TRUE(has("/age: "));
    EXPECT_TRUE(has("/tags/1: "));
    EXPECT_TRUE(has("/tags: "));
    EXPECT_TRUE(has("/extra: "));
    EXPECT_EQ(errors.size(), 5u);
}

TEST(Schema, MissingRequiredProperty) {
    auto errors = schema::collect_errors(kPerson, json{{"name", "bob"}});
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "/age: required property is missing");
}

TEST(Schema, RootTypeMismatchUsesSlash) {
    auto errors = schema::collect_errors(kPerson, json::array());
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].rfind("/: expected object", 0), 0u);
}

TEST(Schema, IntegerAcceptsWholeFloats) {
    json s = {{"type", "integer"}};
    EXPECT_TRUE(schema::collect_errors(s, json(3.0)).empty());
    EXPECT_FALSE(schema::collect_errors(s, json(3.5)).empty());
    EXPECT_FALSE(schema::collect_errors(s, json(std::numeric_limits<double>::infinity())).empty());
}

TEST(Schema, TypeArrayAndConst) {
    json s = {{"type", {"string", "null"}}};
    EXPECT_TRUE(schema::collect_errors(s, json(nullptr)).empty());
    EXPECT_FALSE(schema::collect_errors(s, json(1)).empty());

    json c = {{"const", "fixed"}};
    EXPECT_TRUE(schema::collect_errors(c, json("fixed")).empty());
    EXPECT_FALSE(schema::collect_errors(c, json("other")).empty());
}

TEST(Schema, LengthCountsCodePoints) {
    json s = {{"type", "string"}, {"maxLength", 2}};
    EXPECT_TRUE(schema::collect_errors(s, json("\xc3\xa9\xc3\xa9")).empty());  // "éé"
    EXPECT_FALSE(schema::collect_errors(s, json("abc")).empty());
}

TEST(Schema, Pattern) {
    json s = {{"type", "string"}, {"pattern", "^[a-z]+$"}};
    EXPECT_TRUE(schema::collect_errors(s, json("abc")).empty());
    EXPECT_FALSE(schema::collect_errors(s, json("Abc")).empty());
}

TEST(Schema, PatternRefusesOversizeStringWithoutMatching) {
    json s = {{"type", "string"}, {"pattern", "^(a|b)*$"}};
    std::string huge(200000, 'a');
    std::vector<std::string> errors;
    ASSERT_NO_THROW(errors = schema::collect_errors(s, json(huge)));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("too long to match pattern"), std::string::npos);
    EXPECT_THROW(schema::validate(s, json(huge)), ValidationError);

    std::string at_limit(schema::MAX_PATTERN_INPUT_BYTES, 'b');
    EXPECT_TRUE(schema::collect_errors(s, json(at_limit)).empty());
}

TEST(Schema, AdditionalPropertiesSchema) {
    json s = {{"type", "object"}, {"additionalProperties", {{"type", "number"}}}};
    EXPECT_TRUE(schema::collect_errors(s, json{{"a", 1}, {"b", 2.5}}).empty());
    EXPECT_FALSE(schema::collect_errors(s, json{{"a", "x"}}).empty());
}

TEST(Schema, Combinators) {
    json any = {{"anyOf", {{{"type", "string"}}, {{"type", "integer"}}}}};
    EXPECT_TRUE(schema::collect_errors(any, json(1)).empty());
    EXPECT_FALSE(schema::collect_errors(any, json(true)).empty());

    json one = {{"oneOf", {{{"type", "number"}}, {{"type", "integer"}}}}};
    EXPECT_TRUE(schema::collect_errors(one, json(1.5)).empty());
    EXPECT_FALSE(schema::collect_errors(one, json(2)).empty());  // matches both

    json all = {{"allOf", {{{"type", "integer"}}, {{"minimum", 10}}}}};
    EXPECT_FALSE(schema::collect_errors(all, json(5)).empty());
}

TEST(Schema, UnknownKeywordsIgnored) {
    json s = {{"type", "string"}, {"format", "uri"}, {"x-custom", 1}};
    EXPECT_TRUE(schema::collect_errors(s, json("not a uri")).empty());
}

TEST(Schema, ValidateThrowsWithErrorList) {
    try {
        schema::validate(kPerson, json{{"age", "old"}});
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.code, error::InvalidParams);
        EXPECT_EQ(e.errors.size(), 2u);
        ASSERT_TRUE(e.data.has_value());
        EXPECT_EQ(e.data->at("errors").size(), 2u);
        EXPECT_NE(std::string(e.what()).find("and 1 more"), std::string::npos);
    }
}

TEST(Schema, CheckSchemaRejectsNonSchemas) {
    EXPECT_NO_THROW(schema::check_schema(json{{"type", "object"}}));
    EXPECT_NO_THROW(schema::check_schema(json(true)));
    EXPECT_THROW(schema::check_schema(json("object")), std::invalid_argument);
    EXPECT_THROW(schema::check_schema(json{{"type", 3}}), std::invalid_argument);
}

TEST(Schema, CheckSchemaCompilesNestedPatterns) {
    EXPECT_NO_THROW(schema::check_schema(
        json{{"properties", {{"id", {{"type", "string"}, {"pattern", "^[0-9]+$"}}}}}}));
    EXPECT_THROW(schema::check_schema(json{{"pattern", "(unclosed"}}), std::invalid_argument);
    EXPECT_THROW(schema::check_schema(
                     json{{"properties", {{"id", {{"pattern", "[z-a]"}}}}}}),
                 std::invalid_argument);
    EXPECT_THROW(schema::check_schema(
                     json{{"anyOf", json::array({json{{"items", {{"pattern", "(("}}}}})}}),
                 std::invalid_argument);
}
