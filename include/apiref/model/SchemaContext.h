// Copyright 2024 Robert A. Dunnagan
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#pragma once

#include <optional>

#include <apiref/core/Object.h>
#include <apiref/model/Example.h>
#include <apiref/model/Reference.h>
#include <apiref/model/Schema.h>
#include <apiref/model/codec.h>

namespace apiref {

class Components;
class ResolutionContext;
class DereferencedSchemaContext;

//////////////////////////////////////////////////////////////////////////////
/// @brief Schema-based description of a parameter or header value.
/// Carries the serialization style of the value together with its schema
/// and its examples.  When both a single example and an examples map are
/// given, the examples map is authoritative once dereferenced.
//////////////////////////////////////////////////////////////////////////////
struct SchemaContext
{
    using Dereferenced = DereferencedSchemaContext;

    enum Location {
        QUERY,
        HEADER,
        PATH,
        COOKIE,
    };

    enum Style {
        FORM,
        SIMPLE,
        MATRIX,
        LABEL,
        SPACE_DELIMITED,
        PIPE_DELIMITED,
        DEEP_OBJECT,
    };

    static std::string_view location_name(Location);
    static std::optional<Location> parse_location(const StringView&);
    static std::string_view style_name(Style);
    static std::optional<Style> parse_style(const StringView&);

    static Style default_style(Location location) {
        switch (location) {
            case QUERY:
            case COOKIE: return FORM;
            case HEADER:
            case PATH:   return SIMPLE;
        }
        return FORM;
    }

    static bool default_explode(Style style) { return style == FORM; }

    SchemaContext() = default;
    SchemaContext(Schema schema, Location location = QUERY)
      : location{location}, style{default_style(location)}, explode{default_explode(style)},
        schema{std::move(schema)} {}
    SchemaContext(Schema schema, Location location, Style style, std::optional<bool> explode = std::nullopt)
      : location{location}, style{style}, explode{explode.value_or(default_explode(style))},
        schema{std::move(schema)} {}

    Location location = QUERY;
    Style style = FORM;
    bool explode = true;
    bool allow_reserved = false;
    Schema schema;
    std::optional<Object> example;
    std::optional<ExampleMap> examples;

    DereferencedSchemaContext dereferenced(const Components&) const;
    DereferencedSchemaContext dereferenced(ResolutionContext&) const;

    static SchemaContext decode(const Object& obj, Location location, const String& path = "");
    void encode(Object& obj) const;

    bool operator == (const SchemaContext&) const = default;
};


inline
std::string_view SchemaContext::location_name(Location location) {
    switch (location) {
        case QUERY:  return "query";
        case HEADER: return "header";
        case PATH:   return "path";
        case COOKIE: return "cookie";
    }
    return "<undefined>";
}

inline
std::optional<SchemaContext::Location> SchemaContext::parse_location(const StringView& name) {
    for (auto candidate : {QUERY, HEADER, PATH, COOKIE}) {
        if (location_name(candidate) == name) return candidate;
    }
    return std::nullopt;
}

inline
std::string_view SchemaContext::style_name(Style style) {
    switch (style) {
        case FORM:            return "form";
        case SIMPLE:          return "simple";
        case MATRIX:          return "matrix";
        case LABEL:           return "label";
        case SPACE_DELIMITED: return "spaceDelimited";
        case PIPE_DELIMITED:  return "pipeDelimited";
        case DEEP_OBJECT:     return "deepObject";
    }
    return "<undefined>";
}

inline
std::optional<SchemaContext::Style> SchemaContext::parse_style(const StringView& name) {
    for (auto candidate : {FORM, SIMPLE, MATRIX, LABEL, SPACE_DELIMITED, PIPE_DELIMITED, DEEP_OBJECT}) {
        if (style_name(candidate) == name) return candidate;
    }
    return std::nullopt;
}

namespace codec {

inline
std::optional<SchemaContext::Style> get_style(const Object& obj, const String& path) {
    auto name = get_string(obj, "style", path);
    if (!name) return std::nullopt;
    auto style = SchemaContext::parse_style(*name);
    if (!style)
        throw DecodeError(join_path(path, "style"), fmt::format("unknown style '{}'", *name));
    return style;
}

} // namespace codec

// Decodes the schema-related fields of a parameter or header.  The
// surrounding object owns the remaining keys.
inline
SchemaContext SchemaContext::decode(const Object& obj, Location location, const String& path) {
    codec::expect_map(obj, path);

    auto schema = obj.get("schema");
    if (schema.is_nil())
        throw DecodeError(codec::join_path(path, "schema"), "required field is missing");

    auto style = codec::get_style(obj, path).value_or(default_style(location));
    SchemaContext context{Schema::decode(schema, codec::join_path(path, "schema")), location, style,
                          codec::get_bool(obj, "explode", path)};
    context.allow_reserved = codec::get_bool(obj, "allowReserved", path).value_or(false);
    context.example = codec::get_any(obj, "example");

    if (auto examples = obj.get("examples"); !examples.is_nil())
        context.examples = codec::decode_ref_or_map<Example>(examples, codec::join_path(path, "examples"));

    return context;
}

inline
void SchemaContext::encode(Object& obj) const {
    if (style != default_style(location)) obj.set("style", String{style_name(style)});
    if (explode != default_explode(style)) obj.set("explode", explode);
    if (allow_reserved) obj.set("allowReserved", true);
    obj.set("schema", schema.encode());
    if (example) obj.set("example", *example);
    if (examples) obj.set("examples", codec::encode_ref_or_map(*examples));
}

} // namespace apiref
