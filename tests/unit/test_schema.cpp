#include <gtest/gtest.h>
#include "capwire/schema.hpp"
#include "capwire/error.hpp"

using namespace capwire;

namespace {

nlohmann::json fetch_schema() {
    return nlohmann::json::parse(R"({
        "type": "object",
        "properties": {
            "url": {"type": "string"},
            "retries": {"type": "integer"},
            "mode": {"type": "string", "enum": ["fast", "safe"]},
            "headers": {"type": "array", "items": {"type": "string"}}
        },
        "required": ["url"]
    })");
}

} // namespace

TEST(SchemaCheck, AcceptsObjectSchema) {
    EXPECT_NO_THROW(SchemaValidator::check_schema(fetch_schema()));
    EXPECT_NO_THROW(SchemaValidator::check_schema(nlohmann::json::object()));
}

TEST(SchemaCheck, RejectsNonObjectTopLevel) {
    EXPECT_THROW(SchemaValidator::check_schema(nlohmann::json{{"type", "string"}}), ConfigurationError);
    EXPECT_THROW(SchemaValidator::check_schema(nlohmann::json::array()), ConfigurationError);
}

TEST(SchemaCheck, RejectsMalformedKeywords) {
    try {
        SchemaValidator::check_schema(nlohmann::json{{"type", "object"}, {"required", "url"}});
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.kind(), ConfigurationError::Kind::InvalidSchema);
    }
    EXPECT_THROW(SchemaValidator::check_schema(
                     nlohmann::json{{"type", "object"}, {"properties", {{"x", {{"type", "strng"}}}}}}),
                 ConfigurationError);
}

TEST(SchemaValidate, Conforming) {
    auto v = SchemaValidator::validate(fetch_schema(),
                                       {{"url", "https://example.com"}, {"retries", 2}, {"mode", "fast"}});
    EXPECT_FALSE(v.has_value());
}

TEST(SchemaValidate, MissingRequired) {
    auto v = SchemaValidator::validate(fetch_schema(), {{"retries", 2}});
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->kind, "missing_parameter");
    EXPECT_NE(v->message.find("'url'"), std::string::npos);
}

TEST(SchemaValidate, MissingReportedBeforeTypeMismatch) {
    auto v = SchemaValidator::validate(fetch_schema(), {{"retries", "two"}});
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->kind, "missing_parameter");
}

TEST(SchemaValidate, WrongType) {
    auto v = SchemaValidator::validate(fetch_schema(), {{"url", 42}});
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->kind, "invalid_params");
}

TEST(SchemaValidate, IntegerIsNotFloat) {
    auto v = SchemaValidator::validate(fetch_schema(), {{"url", "u"}, {"retries", 1.5}});
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->kind, "invalid_params");
}

TEST(SchemaValidate, EnumAndItems) {
    EXPECT_TRUE(SchemaValidator::validate(fetch_schema(), {{"url", "u"}, {"mode", "slow"}}).has_value());
    auto v = SchemaValidator::validate(fetch_schema(), {{"url", "u"}, {"headers", {"a", 1}}});
    ASSERT_TRUE(v.has_value());
    EXPECT_NE(v->message.find("headers[1]"), std::string::npos);
}

TEST(SchemaValidate, AdditionalPropertiesFalse) {
    auto schema = fetch_schema();
    EXPECT_FALSE(SchemaValidator::validate(schema, {{"url", "u"}, {"other", 1}}).has_value());
    schema["additionalProperties"] = false;
    auto v = SchemaValidator::validate(schema, {{"url", "u"}, {"other", 1}});
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->kind, "invalid_params");
}

TEST(SchemaValidate, NonObjectArguments) {
    auto v = SchemaValidator::validate(fetch_schema(), nlohmann::json::array());
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->kind, "invalid_params");
}
