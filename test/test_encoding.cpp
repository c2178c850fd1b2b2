#include <gtest/gtest.h>

#include <apiref/core.h>

using namespace apiref;

TEST(Encoding, DecodeDefaults) {
    auto encoding = Encoding::decode("{}"_json);
    EXPECT_TRUE(encoding.content_types.empty());
    EXPECT_FALSE(encoding.headers.has_value());
    EXPECT_EQ(encoding.style, SchemaContext::FORM);
    EXPECT_TRUE(encoding.explode);
    EXPECT_FALSE(encoding.allow_reserved);
    EXPECT_TRUE(encoding.extensions.empty());
}

TEST(Encoding, DecodeSplitsContentTypes) {
    auto encoding = Encoding::decode("{'contentType': ' image/png ,image/jpeg,, text/plain '}"_json);
    EXPECT_EQ(encoding.content_types, (std::vector<String>{"image/png", "image/jpeg", "text/plain"}));
    EXPECT_FALSE(encoding.content_type().has_value());
}

TEST(Encoding, SingleContentType) {
    auto encoding = Encoding::decode("{'contentType': 'application/xml'}"_json);
    EXPECT_EQ(encoding.content_type(), "application/xml");
}

TEST(Encoding, ExplodeDefaultFollowsStyle) {
    auto encoding = Encoding::decode("{'style': 'deepObject'}"_json);
    EXPECT_EQ(encoding.style, SchemaContext::DEEP_OBJECT);
    EXPECT_FALSE(encoding.explode);

    auto exploded = Encoding::decode("{'style': 'deepObject', 'explode': true}"_json);
    EXPECT_TRUE(exploded.explode);
}

TEST(Encoding, DecodeExtensionsAndIgnoresUnknownKeys) {
    auto encoding = Encoding::decode("{'x-trace': {'on': true}, 'x-level': 2, 'bogus': 1}"_json);
    ASSERT_EQ(encoding.extensions.size(), 2UL);
    EXPECT_EQ(encoding.extensions.at("x-trace"), "{'on': true}"_json);
    EXPECT_EQ(encoding.extensions.at("x-level"), 2);
    EXPECT_FALSE(encoding.encode().contains("bogus"));
}

TEST(Encoding, DecodeWrongTypes) {
    EXPECT_THROW(Encoding::decode("{'contentType': 5}"_json), DecodeError);
    EXPECT_THROW(Encoding::decode("{'explode': 'yes'}"_json), DecodeError);
    EXPECT_THROW(Encoding::decode("{'style': 'sideways'}"_json), DecodeError);
    EXPECT_THROW(Encoding::decode("[]"_json), DecodeError);
}

TEST(Encoding, DecodeHeaders) {
    auto encoding = Encoding::decode(R"({
        "headers": {
            "X-Rate": {"$ref": "#/components/headers/Rate"},
            "X-Id": {"schema": {"type": "string"}}
        }
    })"_json);
    ASSERT_TRUE(encoding.headers.has_value());
    EXPECT_TRUE(is_reference(encoding.headers->at("X-Rate")));
    EXPECT_FALSE(is_reference(encoding.headers->at("X-Id")));
}

TEST(Encoding, EncodeMinimal) {
    EXPECT_EQ(Encoding{}.encode(), "{}"_json);
    EXPECT_EQ(Encoding({"text/plain"}).encode(), "{'contentType': 'text/plain'}"_json);
}

TEST(Encoding, EncodeJoinsContentTypes) {
    Encoding encoding{{"image/png", "image/jpeg"}};
    EXPECT_EQ(encoding.encode().get("contentType"), "image/png, image/jpeg");
}

TEST(Encoding, EncodeNonDefaults) {
    Encoding encoding{{"application/json"}, SchemaContext::SPACE_DELIMITED, true, true};
    encoding.extensions.insert({"x-note", "kept"});
    EXPECT_EQ(encoding.encode(), R"({
        "contentType": "application/json",
        "style": "spaceDelimited",
        "explode": true,
        "allowReserved": true,
        "x-note": "kept"
    })"_json);
}

TEST(Encoding, EncodeOmitsDefaultExplodeForStyle) {
    Encoding encoding{{}, SchemaContext::DEEP_OBJECT};
    EXPECT_EQ(encoding.encode(), "{'style': 'deepObject'}"_json);
}

TEST(Encoding, RoundTrip) {
    auto obj = R"({
        "contentType": "image/png, image/jpeg",
        "headers": {"X-Rate": {"$ref": "#/components/headers/Rate"}},
        "style": "pipeDelimited",
        "allowReserved": true,
        "x-a": [1, 2]
    })"_json;
    auto encoding = Encoding::decode(obj);
    EXPECT_EQ(encoding.encode(), obj);
    EXPECT_EQ(Encoding::decode(encoding.encode()), encoding);
}

TEST(Encoding, DereferenceHeaders) {
    auto components = Components::decode(R"({
        "headers": {"Rate": {"description": "calls left", "schema": {"type": "integer"}}}
    })"_json);
    auto encoding = Encoding::decode(R"({
        "contentType": "text/csv",
        "headers": {"X-Rate": {"$ref": "#/components/headers/Rate"}}
    })"_json);

    auto resolved = encoding.dereferenced(components);
    EXPECT_EQ(resolved.content_type(), "text/csv");
    ASSERT_TRUE(resolved.headers().has_value());
    auto& header = resolved.headers()->at("X-Rate");
    EXPECT_EQ(header.description(), "calls left");
    EXPECT_EQ(header.schema().schema().type(), "integer");
}

TEST(Encoding, DereferenceWithoutHeaders) {
    Components components;
    auto resolved = Encoding({"text/plain"}).dereferenced(components);
    EXPECT_FALSE(resolved.headers().has_value());
    EXPECT_EQ(resolved.source(), Encoding({"text/plain"}));
}

TEST(Encoding, DereferenceMissingHeader) {
    Components components;
    auto encoding = Encoding::decode("{'headers': {'X-Rate': {'$ref': '#/components/headers/Rate'}}}"_json);
    try {
        encoding.dereferenced(components);
        FAIL();
    } catch (const NotFound& error) {
        EXPECT_EQ(error.category(), HEADERS);
        EXPECT_EQ(error.name(), "Rate");
    }
}
