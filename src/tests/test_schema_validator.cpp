#include <gtest/gtest.h>

#include <QJsonArray>
#include <QJsonDocument>

#include "mcphub/protocol/schema_validator.h"

using namespace mcphub;

namespace {

SchemaNode schemaFrom(const char* json) {
    return SchemaNode::fromJson(QJsonDocument::fromJson(QByteArray(json)).object());
}

QJsonObject args(const char* json) {
    return QJsonDocument::fromJson(QByteArray(json)).object();
}

const char* kAddSchema = R"({
    "type": "object",
    "properties": {
        "a": {"type": "number"},
        "b": {"type": "number"}
    },
    "required": ["a", "b"]
})";

} // namespace

TEST(SchemaValidator, AcceptsValidArguments) {
    const auto r = SchemaValidator::validateArguments(args(R"({"a": 1, "b": 2.5})"),
                                                      schemaFrom(kAddSchema));
    EXPECT_TRUE(r.valid) << qPrintable(r.toString());
}

TEST(SchemaValidator, MissingRequiredField) {
    const auto r = SchemaValidator::validateArguments(args(R"({"a": 1})"), schemaFrom(kAddSchema));
    EXPECT_FALSE(r.valid);
    EXPECT_EQ(r.errorPath, "b");
}

TEST(SchemaValidator, WrongType) {
    const auto r = SchemaValidator::validateArguments(args(R"({"a": "1", "b": 2})"),
                                                      schemaFrom(kAddSchema));
    EXPECT_FALSE(r.valid);
    EXPECT_EQ(r.errorPath, "a");
    EXPECT_EQ(r.toString(), "a: expected number");
}

TEST(SchemaValidator, IntegerRejectsDecimal) {
    const SchemaNode s = schemaFrom(R"({"properties": {"n": {"type": "integer"}}})");
    EXPECT_TRUE(SchemaValidator::validateArguments(args(R"({"n": 4})"), s).valid);
    EXPECT_FALSE(SchemaValidator::validateArguments(args(R"({"n": 4.5})"), s).valid);
}

TEST(SchemaValidator, AdditionalPropertiesFalse) {
    const SchemaNode s = schemaFrom(
        R"({"type": "object", "properties": {"x": {}}, "additionalProperties": false})");
    EXPECT_TRUE(SchemaValidator::validateArguments(args(R"({"x": 1})"), s).valid);

    const auto r = SchemaValidator::validateArguments(args(R"({"x": 1, "y": 2})"), s);
    EXPECT_FALSE(r.valid);
    EXPECT_EQ(r.errorPath, "y");
}

TEST(SchemaValidator, UndeclaredPropertiesAllowedByDefault) {
    EXPECT_TRUE(SchemaValidator::validateArguments(args(R"({"a": 1, "b": 2, "c": "x"})"),
                                                   schemaFrom(kAddSchema))
                    .valid);
}

TEST(SchemaValidator, NestedArrayPath) {
    const SchemaNode s = schemaFrom(R"({
        "type": "object",
        "properties": {
            "items": {"type": "array", "items": {
                "type": "object",
                "properties": {"name": {"type": "string"}},
                "required": ["name"]
            }}
        }
    })");

    const auto r = SchemaValidator::validateArguments(
        args(R"({"items": [{"name": "a"}, {"name": "b"}, {"name": 3}]})"), s);
    EXPECT_FALSE(r.valid);
    EXPECT_EQ(r.errorPath, "items[2].name");
}

TEST(SchemaValidator, EnumAndRanges) {
    const SchemaNode s = schemaFrom(R"({
        "type": "object",
        "properties": {
            "mode": {"type": "string", "enum": ["fast", "slow"]},
            "level": {"type": "number", "minimum": 0, "maximum": 10},
            "label": {"type": "string", "maxLength": 3},
            "list": {"type": "array", "minItems": 1}
        }
    })");

    EXPECT_TRUE(SchemaValidator::validateArguments(
                    args(R"({"mode": "fast", "level": 10, "label": "abc", "list": [1]})"), s)
                    .valid);
    EXPECT_FALSE(SchemaValidator::validateArguments(args(R"({"mode": "medium"})"), s).valid);
    EXPECT_FALSE(SchemaValidator::validateArguments(args(R"({"level": -1})"), s).valid);
    EXPECT_FALSE(SchemaValidator::validateArguments(args(R"({"level": 11})"), s).valid);
    EXPECT_FALSE(SchemaValidator::validateArguments(args(R"({"label": "abcd"})"), s).valid);
    EXPECT_FALSE(SchemaValidator::validateArguments(args(R"({"list": []})"), s).valid);
}

TEST(SchemaValidator, NullableAcceptsNull) {
    const SchemaNode s =
        schemaFrom(R"({"properties": {"v": {"type": ["integer", "null"]}}, "required": ["v"]})");
    EXPECT_TRUE(SchemaValidator::validateArguments(args(R"({"v": null})"), s).valid);
    EXPECT_FALSE(SchemaValidator::validateArguments(args(R"({"v": "x"})"), s).valid);
}

TEST(SchemaValidator, EmptySchemaAcceptsAnything) {
    EXPECT_TRUE(SchemaValidator::validateArguments(args(R"({"anything": [1, 2]})"), SchemaNode())
                    .valid);
}

TEST(SchemaValidator, NonObjectTopLevelRejected) {
    EXPECT_FALSE(
        SchemaValidator::validateArguments(QJsonObject{}, schemaFrom(R"({"type": "string"})"))
            .valid);
}
