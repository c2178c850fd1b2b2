#include <gtest/gtest.h>

#include <apiref/core.h>

using namespace apiref;

namespace {

Components example_components() {
    return Components::decode(R"({
        "schemas": {
            "Limit": {"type": "integer", "format": "int32"}
        },
        "examples": {
            "small": {"summary": "a small page", "value": 10},
            "large": {"value": 500},
            "remote": {"externalValue": "https://example.com/limit.json"}
        }
    })"_json);
}

} // namespace

TEST(SchemaContext, DefaultStyles) {
    EXPECT_EQ(SchemaContext::default_style(SchemaContext::QUERY), SchemaContext::FORM);
    EXPECT_EQ(SchemaContext::default_style(SchemaContext::COOKIE), SchemaContext::FORM);
    EXPECT_EQ(SchemaContext::default_style(SchemaContext::PATH), SchemaContext::SIMPLE);
    EXPECT_EQ(SchemaContext::default_style(SchemaContext::HEADER), SchemaContext::SIMPLE);
    EXPECT_TRUE(SchemaContext::default_explode(SchemaContext::FORM));
    EXPECT_FALSE(SchemaContext::default_explode(SchemaContext::DEEP_OBJECT));
}

TEST(SchemaContext, StyleNames) {
    EXPECT_EQ(SchemaContext::style_name(SchemaContext::SPACE_DELIMITED), "spaceDelimited");
    EXPECT_EQ(SchemaContext::parse_style("pipeDelimited"), SchemaContext::PIPE_DELIMITED);
    EXPECT_EQ(SchemaContext::parse_style("deepObject"), SchemaContext::DEEP_OBJECT);
    EXPECT_FALSE(SchemaContext::parse_style("tabDelimited").has_value());
    EXPECT_EQ(SchemaContext::parse_location("cookie"), SchemaContext::COOKIE);
}

TEST(SchemaContext, DecodeDefaults) {
    auto context = SchemaContext::decode("{'schema': {'type': 'string'}}"_json, SchemaContext::PATH);
    EXPECT_EQ(context.location, SchemaContext::PATH);
    EXPECT_EQ(context.style, SchemaContext::SIMPLE);
    EXPECT_FALSE(context.explode);
    EXPECT_FALSE(context.allow_reserved);
    EXPECT_FALSE(context.example.has_value());
    EXPECT_FALSE(context.examples.has_value());
}

TEST(SchemaContext, DecodeRequiresSchema) {
    EXPECT_THROW(SchemaContext::decode("{'style': 'form'}"_json, SchemaContext::QUERY), DecodeError);
}

TEST(SchemaContext, DecodeUnknownStyle) {
    EXPECT_THROW(SchemaContext::decode("{'style': 'fancy', 'schema': {}}"_json, SchemaContext::QUERY), DecodeError);
}

TEST(SchemaContext, EncodeOmitsDefaults) {
    Object obj{Object::MAP};
    SchemaContext{Schema::of_type("string"), SchemaContext::QUERY}.encode(obj);
    EXPECT_EQ(obj, "{'schema': {'type': 'string'}}"_json);

    Object styled{Object::MAP};
    SchemaContext{Schema::of_type("array"), SchemaContext::QUERY, SchemaContext::PIPE_DELIMITED, true}.encode(styled);
    EXPECT_EQ(styled, "{'style': 'pipeDelimited', 'explode': true, 'schema': {'type': 'array'}}"_json);
}

TEST(SchemaContext, DereferenceSchemaAndPassThroughFields) {
    auto components = example_components();
    auto context = SchemaContext::decode(R"({
        "style": "spaceDelimited",
        "explode": false,
        "allowReserved": true,
        "schema": {"$ref": "#/components/schemas/Limit"}
    })"_json, SchemaContext::QUERY);

    auto resolved = context.dereferenced(components);
    EXPECT_EQ(resolved.schema().format(), "int32");
    EXPECT_EQ(resolved.style(), SchemaContext::SPACE_DELIMITED);
    EXPECT_FALSE(resolved.explode());
    EXPECT_TRUE(resolved.allow_reserved());
    EXPECT_EQ(resolved.location(), SchemaContext::QUERY);
    EXPECT_EQ(resolved.source(), context);
}

TEST(SchemaContext, SingleExamplePassesThrough) {
    auto components = example_components();
    auto context = SchemaContext::decode("{'schema': {'type': 'integer'}, 'example': 25}"_json, SchemaContext::QUERY);
    auto resolved = context.dereferenced(components);
    EXPECT_EQ(resolved.example(), Object{25});
    EXPECT_FALSE(resolved.examples().has_value());
}

TEST(SchemaContext, ExamplesMapIsResolvedInOrder) {
    auto components = example_components();
    auto context = SchemaContext::decode(R"({
        "schema": {"type": "integer"},
        "examples": {
            "first": {"$ref": "#/components/examples/large"},
            "second": {"value": 3},
            "third": {"$ref": "#/components/examples/small"}
        }
    })"_json, SchemaContext::QUERY);

    auto resolved = context.dereferenced(components);
    ASSERT_TRUE(resolved.examples().has_value());
    auto& examples = *resolved.examples();

    std::vector<String> keys;
    for (auto& [name, example] : examples)
        keys.push_back(name);
    EXPECT_EQ(keys, (std::vector<String>{"first", "second", "third"}));
    EXPECT_EQ(examples.at("first").value, Object{500});
    EXPECT_EQ(examples.at("third").summary, "a small page");
}

TEST(SchemaContext, DerivedExampleIsFirstEntryValue) {
    auto components = example_components();
    auto context = SchemaContext::decode(R"({
        "schema": {"type": "integer"},
        "example": 1,
        "examples": {
            "first": {"$ref": "#/components/examples/small"},
            "second": {"value": 3}
        }
    })"_json, SchemaContext::QUERY);

    auto resolved = context.dereferenced(components);
    EXPECT_EQ(resolved.example(), Object{10});
}

TEST(SchemaContext, ExternalFirstEntryKeepsSingleExample) {
    auto components = example_components();
    auto context = SchemaContext::decode(R"({
        "schema": {"type": "integer"},
        "example": 1,
        "examples": {"first": {"$ref": "#/components/examples/remote"}}
    })"_json, SchemaContext::QUERY);

    auto resolved = context.dereferenced(components);
    EXPECT_EQ(resolved.example(), Object{1});
    EXPECT_EQ(resolved.examples()->at("first").external_value, "https://example.com/limit.json");
    EXPECT_EQ(resolved.inlined().example, Object{1});
}

TEST(SchemaContext, EmptyExamplesMapKeepsSingleExample) {
    auto components = example_components();
    auto context = SchemaContext::decode("{'schema': {}, 'example': 7, 'examples': {}}"_json, SchemaContext::QUERY);
    auto resolved = context.dereferenced(components);
    EXPECT_EQ(resolved.example(), Object{7});
    ASSERT_TRUE(resolved.examples().has_value());
    EXPECT_EQ(resolved.examples()->size(), 0UL);
}

TEST(SchemaContext, FailingExampleAbortsResolution) {
    auto components = example_components();
    auto context = SchemaContext::decode(R"({
        "schema": {"type": "integer"},
        "examples": {
            "ok": {"$ref": "#/components/examples/small"},
            "broken": {"$ref": "#/components/examples/missing"}
        }
    })"_json, SchemaContext::QUERY);

    try {
        context.dereferenced(components);
        FAIL();
    } catch (const NotFound& error) {
        EXPECT_EQ(error.category(), EXAMPLES);
        EXPECT_EQ(error.name(), "missing");
    }
}

TEST(SchemaContext, FailingSchemaAbortsResolution) {
    auto components = example_components();
    auto context = SchemaContext::decode("{'schema': {'$ref': '#/components/schemas/Nope'}, 'example': 1}"_json,
                                         SchemaContext::QUERY);
    EXPECT_THROW(context.dereferenced(components), NotFound);
}

TEST(SchemaContext, InlinedDropsSingleExampleWhenMapWins) {
    auto components = example_components();
    auto context = SchemaContext::decode(R"({
        "schema": {"$ref": "#/components/schemas/Limit"},
        "example": 1,
        "examples": {"first": {"$ref": "#/components/examples/small"}}
    })"_json, SchemaContext::QUERY);

    Object obj{Object::MAP};
    context.dereferenced(components).inlined().encode(obj);
    EXPECT_EQ(obj, R"({
        "schema": {"type": "integer", "format": "int32"},
        "examples": {"first": {"summary": "a small page", "value": 10}}
    })"_json);
}
