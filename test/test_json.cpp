#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>

#include <apiref/parser/json.h>

using namespace apiref;
using namespace apiref::json;
using namespace apiref::json::impl;

using StreamAdapter = parse::StreamAdapter<std::stringstream>;

TEST(Json, ParseNull) {
    std::stringstream stream{"null"};
    Parser parser{StreamAdapter{stream}};
    ASSERT_TRUE(parser.parse_object('\0'));
    EXPECT_TRUE(parser.m_curr == nil);
}

TEST(Json, ParseTypeBool) {
    std::stringstream stream{"false"};
    Parser parser{StreamAdapter{stream}};
    EXPECT_EQ(parser.parse_type(), Object::BOOL);
}

TEST(Json, ParseTypeMap) {
    std::stringstream stream{"  {'a': 1}"};
    Parser parser{StreamAdapter{stream}};
    EXPECT_EQ(parser.parse_type(), Object::MAP);
}

TEST(Json, ParseNumberSignedInt) {
    std::stringstream stream{"-37"};
    Parser parser{StreamAdapter{stream}};
    ASSERT_TRUE(parser.parse_number());
    EXPECT_EQ(parser.m_curr.as<Int>(), -37);
}

TEST(Json, ParseNumberOverflowBecomesFloat) {
    std::stringstream stream{"100000000000000000000"};
    Parser parser{StreamAdapter{stream}};
    ASSERT_TRUE(parser.parse_number());
    EXPECT_TRUE(parser.m_curr.is_float());
    EXPECT_EQ(parser.m_curr.as<Float>(), 1e20);
}

TEST(Json, ParseNumberFloat) {
    std::stringstream stream{"3.14159"};
    Parser parser{StreamAdapter{stream}};
    EXPECT_TRUE(parser.parse_number());
    EXPECT_EQ(parser.m_curr.as<Float>(), 3.14159);
}

TEST(Json, ParseNumberExponent) {
    std::stringstream stream{"2e3"};
    Parser parser{StreamAdapter{stream}};
    EXPECT_TRUE(parser.parse_number());
    EXPECT_EQ(parser.m_curr.as<Float>(), 2000.0);
}

TEST(Json, ParseNumberSyntaxError) {
    std::stringstream stream{"1-2"};
    Parser parser{StreamAdapter{stream}};
    EXPECT_FALSE(parser.parse_number());
    EXPECT_EQ(parser.m_error_message, "Numeric syntax error");
}

TEST(Json, ParseDoubleQuotedString) {
    auto obj = json::parse("\"tic\"");
    EXPECT_EQ(obj, "tic");
}

TEST(Json, ParseSingleQuotedString) {
    auto obj = json::parse("'it\\'s'");
    EXPECT_EQ(obj, "it's");
}

TEST(Json, ParseStringEscapes) {
    auto obj = json::parse(R"("a\"b\\c\/d\n\t")");
    EXPECT_EQ(obj, "a\"b\\c/d\n\t");
}

TEST(Json, ParseUnicodeEscape) {
    auto obj = json::parse(R"("\u00e9\u0041")");
    EXPECT_EQ(obj, "\xC3\xA9" "A");
}

TEST(Json, ParseUnicodeSurrogatePair) {
    auto obj = json::parse(R"("\ud83d\ude00!")");
    EXPECT_EQ(obj, "\xF0\x9F\x98\x80" "!");
}

TEST(Json, ParseLoneHighSurrogate) {
    std::string error;
    auto obj = json::parse(R"("\ud83d")", error);
    EXPECT_TRUE(obj.is_nil());
    EXPECT_NE(error.find("Unpaired surrogate"), std::string::npos);

    json::parse(R"("\ud83d\u0041")", error);
    EXPECT_NE(error.find("Unpaired surrogate"), std::string::npos);
}

TEST(Json, ParseLoneLowSurrogate) {
    std::string error;
    json::parse(R"("\ude00")", error);
    EXPECT_NE(error.find("Unpaired surrogate"), std::string::npos);
}

TEST(Json, ParseInvalidEscape) {
    std::string error;
    auto obj = json::parse(R"("\q")", error);
    EXPECT_TRUE(obj.is_nil());
    EXPECT_NE(error.find("Invalid escape sequence"), std::string::npos);
}

TEST(Json, ParseUnterminatedString) {
    std::string error;
    json::parse("'abc", error);
    EXPECT_NE(error.find("Unterminated string"), std::string::npos);
}

TEST(Json, ParseEmptyList) {
    auto obj = json::parse("[]");
    ASSERT_TRUE(obj.is_list());
    EXPECT_EQ(obj.size(), 0UL);
}

TEST(Json, ParseNestedList) {
    auto obj = json::parse("[1, [2, 3], {'x': null}]");
    ASSERT_TRUE(obj.is_list());
    EXPECT_EQ(obj.get(0UL), 1);
    EXPECT_EQ(obj.get(1UL).get(1UL), 3);
    EXPECT_TRUE(obj.get(2UL).get("x").is_nil());
    EXPECT_TRUE(obj.get(2UL).contains("x"));
}

TEST(Json, ParseMapKeepsKeyOrder) {
    auto obj = json::parse(R"({"b": 1, "a": 2, "c": 3})");
    std::vector<String> keys;
    for (auto& [key, value] : obj.map())
        keys.push_back(key);
    EXPECT_EQ(keys, (std::vector<String>{"b", "a", "c"}));
}

TEST(Json, ParseMapDuplicateKeyLastWins) {
    auto obj = json::parse("{'a': 1, 'a': 2}");
    EXPECT_EQ(obj.size(), 1UL);
    EXPECT_EQ(obj.get("a"), 2);
}

TEST(Json, ParseMapUnquotedKey) {
    std::string error;
    json::parse("{a: 1}", error);
    EXPECT_NE(error.find("Expected dictionary key"), std::string::npos);
}

TEST(Json, ParseMapMissingColon) {
    std::string error;
    json::parse("{'a' 1}", error);
    EXPECT_NE(error.find("Expected token ':'"), std::string::npos);
}

TEST(Json, ParseMapMissingComma) {
    std::string error;
    json::parse("{'a': 1 'b': 2}", error);
    EXPECT_NE(error.find("Expected token ',' or '}'"), std::string::npos);
}

TEST(Json, ParseTrailingCharacters) {
    std::optional<Error> error;
    json::parse("{} x", error);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->error_message, "Unexpected trailing characters");
    EXPECT_EQ(error->error_offset, 3UL);
}

TEST(Json, ParseEmptyDocument) {
    std::optional<Error> error;
    json::parse("   ", error);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->error_message, "No object in json stream");
}

TEST(Json, ParseThrowsSyntaxError) {
    EXPECT_THROW(json::parse("[1, 2"), parse::SyntaxError);

    try {
        json::parse("[tru]");
        FAIL();
    } catch (const parse::SyntaxError& error) {
        EXPECT_EQ(error.offset(), 4);
    }
}

TEST(Json, UserDefinedLiteral) {
    auto obj = "{'schemas': {'Pet': {'type': 'object'}}}"_json;
    EXPECT_EQ(obj.get("schemas").get("Pet").get("type"), "object");
}

TEST(Json, RoundTripThroughText) {
    auto obj = R"({"a": [1, 2.5, "x", true, null], "b": {"c": "d"}})"_json;
    EXPECT_EQ(json::parse(obj.to_json()), obj);
}

TEST(Json, ParseFile) {
    auto file_name = std::string{"apiref_test_parse_file.json"};
    {
        std::ofstream f_out{file_name};
        f_out << "{'name': 'value', 'list': [1, 2, 3]}";
    }

    std::string error;
    auto obj = json::parse_file(file_name, error);
    std::remove(file_name.c_str());

    EXPECT_EQ(error, "");
    EXPECT_EQ(obj.get("name"), "value");
    EXPECT_EQ(obj.get("list").size(), 3UL);
}

TEST(Json, ParseFileMissing) {
    std::string error;
    auto obj = json::parse_file("apiref_no_such_file.json", error);
    EXPECT_TRUE(obj.is_nil());
    EXPECT_NE(error.find("Error opening file"), std::string::npos);
}
