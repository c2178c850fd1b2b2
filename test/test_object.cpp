#include <gtest/gtest.h>
#include <fmt/format.h>

#include <apiref/core/Object.h>
#include <apiref/parser/json.h>

using namespace apiref;

TEST(Object, TypeName) {
    EXPECT_EQ(Object{}.type_name(), "nil");
    EXPECT_EQ(Object{nil}.type_name(), "nil");
    EXPECT_EQ(Object{true}.type_name(), "bool");
    EXPECT_EQ(Object{-1}.type_name(), "int");
    EXPECT_EQ(Object{1.5}.type_name(), "double");
    EXPECT_EQ(Object{"foo"}.type_name(), "string");
    EXPECT_EQ(Object{Object::LIST}.type_name(), "list");
    EXPECT_EQ(Object{Object::MAP}.type_name(), "map");
}

TEST(Object, Nil) {
    Object v;
    EXPECT_TRUE(v.is_nil());
    EXPECT_TRUE(v == nil);
    EXPECT_EQ(v.to_json(), "null");
}

TEST(Object, Bool) {
    Object v{true};
    EXPECT_TRUE(v.is_bool());
    EXPECT_FALSE(v.is_num());
    EXPECT_EQ(v.as<bool>(), true);
    EXPECT_EQ(v.to_json(), "true");

    v = false;
    EXPECT_EQ(v.to_json(), "false");
}

TEST(Object, Int) {
    Object v{-37};
    EXPECT_TRUE(v.is_int());
    EXPECT_TRUE(v.is_num());
    EXPECT_EQ(v.as<Int>(), -37);
    EXPECT_EQ(v.to_json(), "-37");
}

TEST(Object, Float) {
    Object v{3.25};
    EXPECT_TRUE(v.is_float());
    EXPECT_EQ(v.as<Float>(), 3.25);
    EXPECT_EQ(v.to_json(), "3.25");
}

TEST(Object, NumericEquality) {
    EXPECT_EQ(Object{1}, Object{1.0});
    EXPECT_NE(Object{1}, Object{"1"});
    EXPECT_NE(Object{true}, Object{1});
}

TEST(Object, WrongTypeAccess) {
    Object v{"text"};
    EXPECT_THROW(v.as<Int>(), WrongType);
    EXPECT_THROW(v.list(), WrongType);
    EXPECT_THROW(v.get("key"), WrongType);
}

TEST(Object, StringEscapes) {
    Object v{"say \"hi\"\n"};
    EXPECT_EQ(v.to_json(), "\"say \\\"hi\\\"\\n\"");
    EXPECT_EQ(v.to_str(), "say \"hi\"\n");
}

TEST(Object, ControlCharactersEscapedInJson) {
    Object map{Object::MAP};
    map.set("line\nbreak", "tab\there\x01");
    EXPECT_EQ(map.to_json(), R"({"line\nbreak": "tab\there\u0001"})");
    EXPECT_EQ(json::parse(map.to_json()), map);
}

TEST(Object, ListAccess) {
    Object list{Object::LIST};
    list.push_back(1);
    list.push_back("two");
    EXPECT_EQ(list.size(), 2UL);
    EXPECT_EQ(list.get(0UL), 1);
    EXPECT_EQ(list.get(1UL), "two");
    EXPECT_TRUE(list.get(2UL).is_nil());
    EXPECT_EQ(list.to_json(), "[1, \"two\"]");
}

TEST(Object, MapPreservesInsertionOrder) {
    Object map{Object::MAP};
    map.set("zeta", 1);
    map.set("alpha", 2);
    map.set("mid", 3);
    EXPECT_EQ(map.to_json(), "{\"zeta\": 1, \"alpha\": 2, \"mid\": 3}");
}

TEST(Object, MapGetMissingIsNil) {
    Object map{Object::MAP};
    map.set("a", 1);
    EXPECT_TRUE(map.contains("a"));
    EXPECT_FALSE(map.contains("b"));
    EXPECT_TRUE(map.get("b").is_nil());
}

TEST(Object, MapDelete) {
    Object map{Object::MAP};
    map.set("a", 1);
    map.set("b", 2);
    map.del("a");
    EXPECT_EQ(map.size(), 1UL);
    EXPECT_EQ(map.to_json(), "{\"b\": 2}");
}

TEST(Object, MapEqualityIgnoresOrder) {
    auto lhs = "{'a': 1, 'b': [1, 2]}"_json;
    auto rhs = "{'b': [1, 2], 'a': 1}"_json;
    EXPECT_EQ(lhs, rhs);
    EXPECT_NE(lhs, "{'a': 1, 'b': [2, 1]}"_json);
}

TEST(Object, CopiesShareContainers) {
    Object map{Object::MAP};
    Object alias = map;
    alias.set("x", 1);
    EXPECT_TRUE(map.is(alias));
    EXPECT_EQ(map.get("x"), 1);
}

TEST(Object, DeepCopyIsIndependent) {
    auto original = "{'x': {'y': 1}}"_json;
    auto copy = original.copy();
    EXPECT_EQ(copy, original);
    EXPECT_FALSE(copy.is(original));

    copy.get("x").set("y", 2);
    EXPECT_EQ(original.get("x").get("y"), 1);
}

TEST(Object, StreamOutput) {
    std::stringstream ss;
    ss << "{'a': [true, null]}"_json;
    EXPECT_EQ(ss.str(), "{\"a\": [true, null]}");
}
