/**
 * @file json_helpers_test.cpp
 * @brief Tests for JSON helpers.
 */

#include "core/json_helpers.h"

#include <gtest/gtest.h>

#include <sstream>

namespace moira {
namespace json {
namespace {

// ============================================================================
// escape() tests
// ============================================================================

TEST(JsonEscapeTest, PlainString) {
  EXPECT_EQ(escape("hello"), "hello");
  EXPECT_EQ(escape(""), "");
}

TEST(JsonEscapeTest, QuoteAndBackslash) {
  EXPECT_EQ(escape("say \"hello\""), "say \\\"hello\\\"");
  EXPECT_EQ(escape("path\\to"), "path\\\\to");
}

TEST(JsonEscapeTest, ControlCharacters) {
  EXPECT_EQ(escape("line1\nline2"), "line1\\nline2");
  EXPECT_EQ(escape("col1\tcol2"), "col1\\tcol2");
  EXPECT_EQ(escape(std::string("a\x01" "b")), "a\\u0001b");
  EXPECT_EQ(escape(std::string("\x1f")), "\\u001f");
}

TEST(JsonEscapeTest, Utf8PassesThrough) {
  EXPECT_EQ(escape("E\xE2\x99\xAD"), "E\xE2\x99\xAD");
}

// ============================================================================
// Writer
// ============================================================================

TEST(JsonWriterTest, EmptyContainers) {
  std::ostringstream obj;
  Writer obj_writer(obj);
  obj_writer.beginObject().endObject();
  EXPECT_EQ(obj.str(), "{}");

  std::ostringstream arr;
  Writer arr_writer(arr);
  arr_writer.beginArray().endArray();
  EXPECT_EQ(arr.str(), "[]");
}

TEST(JsonWriterTest, ObjectWithAllTypes) {
  std::ostringstream oss;
  Writer w(oss);
  w.beginObject()
      .write("str", "hello")
      .write("int", 123)
      .write("bool", true)
      .writeNull("none")
      .write("name", std::string("Eb4"))
      .endObject();
  EXPECT_EQ(oss.str(), R"({"str":"hello","int":123,"bool":true,"none":null,"name":"Eb4"})");
}

TEST(JsonWriterTest, ArrayOfObjects) {
  std::ostringstream oss;
  Writer w(oss);
  w.beginObject().beginArray("tracks");
  w.beginObject().write("id", "a").endObject();
  w.beginObject().write("id", "b").endObject();
  w.endArray().endObject();
  EXPECT_EQ(oss.str(), R"({"tracks":[{"id":"a"},{"id":"b"}]})");
}

TEST(JsonWriterTest, ArrayValues) {
  std::ostringstream oss;
  Writer w(oss);
  w.beginArray().value(1).value("x").value(false).nullValue().endArray();
  EXPECT_EQ(oss.str(), R"([1,"x",false,null])");
}

TEST(JsonWriterPrettyTest, NestedObject) {
  std::ostringstream oss;
  Writer w(oss, true);
  w.beginObject()
      .write("outer", "value")
      .beginObject("nested")
      .write("inner", 123)
      .endObject()
      .endObject();

  std::string expected = R"({
  "outer": "value",
  "nested": {
    "inner": 123
  }
})";
  EXPECT_EQ(oss.str(), expected);
}

TEST(JsonWriterPrettyTest, ArrayInObject) {
  std::ostringstream oss;
  Writer w(oss, true);
  w.beginObject().beginArray("items").value(1).value(2).endArray().endObject();

  std::string expected = R"({
  "items": [
    1,
    2
  ]
})";
  EXPECT_EQ(oss.str(), expected);
}

// ============================================================================
// Parser
// ============================================================================

Value parseOk(const std::string& text) {
  Parser parser(text);
  Value value;
  EXPECT_TRUE(parser.parse(value)) << parser.error();
  return value;
}

std::string parseError(const std::string& text) {
  Parser parser(text);
  Value value;
  EXPECT_FALSE(parser.parse(value)) << text;
  return parser.error();
}

TEST(JsonParserTest, Scalars) {
  EXPECT_TRUE(parseOk("null").isNull());
  EXPECT_TRUE(parseOk("true").asBool());
  EXPECT_FALSE(parseOk(" false ").asBool());
  EXPECT_EQ(parseOk("\"hi\"").asString(), "hi");
}

TEST(JsonParserTest, Numbers) {
  Value integer = parseOk("-42");
  EXPECT_TRUE(integer.isInteger());
  EXPECT_EQ(integer.asInt(), -42);

  Value fraction = parseOk("1.5");
  EXPECT_TRUE(fraction.isNumber());
  EXPECT_FALSE(fraction.isInteger());
  EXPECT_DOUBLE_EQ(fraction.asDouble(), 1.5);

  Value exponent = parseOk("2e2");
  EXPECT_FALSE(exponent.isInteger());
  EXPECT_DOUBLE_EQ(exponent.asDouble(), 200.0);

  // Too large for int64: still a number, but not an integer.
  Value huge = parseOk("123456789012345678901234567890");
  EXPECT_TRUE(huge.isNumber());
  EXPECT_FALSE(huge.isInteger());
}

TEST(JsonParserTest, ObjectKeepsMemberOrder) {
  Value doc = parseOk(R"({"b": 1, "a": [1, 2, {"c": null}], "1/2": "x"})");
  ASSERT_TRUE(doc.isObject());
  const auto& members = doc.asObject();
  ASSERT_EQ(members.size(), 3u);
  EXPECT_EQ(members[0].key, "b");
  EXPECT_EQ(members[1].key, "a");
  EXPECT_EQ(members[2].key, "1/2");

  const Value* a = doc.find("a");
  ASSERT_NE(a, nullptr);
  ASSERT_EQ(a->asArray().size(), 3u);
  EXPECT_TRUE(a->asArray()[2].find("c")->isNull());
  EXPECT_EQ(doc.find("missing"), nullptr);
}

TEST(JsonParserTest, StringEscapes) {
  EXPECT_EQ(parseOk(R"("a\"b\\c\/d\n")").asString(), "a\"b\\c/d\n");
  EXPECT_EQ(parseOk(R"("\u00e9")").asString(), "\xC3\xA9");
  EXPECT_EQ(parseOk(R"("\u266D")").asString(), "\xE2\x99\xAD");
  // Surrogate pair for U+1D12A (double sharp)
  EXPECT_EQ(parseOk(R"("\uD834\uDD2A")").asString(), "\xF0\x9D\x84\xAA");
  parseError(R"("\uD834")");
}

TEST(JsonParserTest, ErrorsReportPosition) {
  EXPECT_NE(parseError("{\"a\": }").find("line 1"), std::string::npos);
  EXPECT_NE(parseError("[1,\n2,\n]").find("line 3"), std::string::npos);
}

TEST(JsonParserTest, RejectsMalformedInput) {
  parseError("");
  parseError("{");
  parseError("[1 2]");
  parseError("{\"a\" 1}");
  parseError("tru");
  parseError("\"unterminated");
  parseError("01");
  parseError("{} extra");
  parseError("'single'");
}

TEST(JsonParserTest, RejectsExcessiveNesting) {
  std::string deep(300, '[');
  deep += std::string(300, ']');
  EXPECT_NE(parseError(deep).find("Nesting too deep"), std::string::npos);
}

TEST(JsonValueTest, BuildDocument) {
  Value doc = Value::makeObject();
  doc.insert("bpm", Value::makeInteger(120));
  Value tracks = Value::makeArray();
  tracks.push(Value::makeString("melody"));
  doc.insert("tracks", std::move(tracks));

  EXPECT_EQ(doc.find("bpm")->asInt(), 120);
  EXPECT_EQ(doc.find("tracks")->asArray()[0].asString(), "melody");
  EXPECT_STREQ(Value::typeName(doc.type()), "object");
  EXPECT_STREQ(Value::typeName(Value::makeBool(true).type()), "bool");
}

}  // namespace
}  // namespace json
}  // namespace moira
