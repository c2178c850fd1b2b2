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
#include <variant>

#include <apiref/core/Object.h>
#include <apiref/model/Content.h>
#include <apiref/model/SchemaContext.h>
#include <apiref/model/codec.h>

namespace apiref {

class Components;
class ResolutionContext;
class DereferencedParameter;

//////////////////////////////////////////////////////////////////////////////
/// @brief Parameter object.
/// The value is described either by a schema context or by a content map
/// holding a single media type.  Path parameters are always required.
//////////////////////////////////////////////////////////////////////////////
struct Parameter
{
    using Dereferenced = DereferencedParameter;
    using Location = SchemaContext::Location;

    Parameter() = default;
    Parameter(const String& name, Location location, Schema schema)
      : name{name}, location{location}, required{location == SchemaContext::PATH},
        schema_or_content{SchemaContext{std::move(schema), location}} {}
    Parameter(const String& name, Location location, ContentMap content)
      : name{name}, location{location}, required{location == SchemaContext::PATH},
        schema_or_content{std::move(content)} {}

    String name;
    Location location = SchemaContext::QUERY;
    std::optional<String> description;
    bool required = false;
    bool deprecated = false;
    bool allow_empty_value = false;
    std::variant<SchemaContext, ContentMap> schema_or_content;
    Extensions extensions;

    const SchemaContext* schema_context() const { return std::get_if<SchemaContext>(&schema_or_content); }
    const ContentMap* content() const           { return std::get_if<ContentMap>(&schema_or_content); }

    DereferencedParameter dereferenced(const Components&) const;
    DereferencedParameter dereferenced(ResolutionContext&) const;

    static Parameter decode(const Object& obj, const String& path = "");
    Object encode() const;

    bool operator == (const Parameter&) const = default;
};


inline
Parameter Parameter::decode(const Object& obj, const String& path) {
    codec::expect_map(obj, path);
    codec::log_ignored_keys(obj, {"name", "in", "description", "required", "deprecated", "allowEmptyValue",
                                  "style", "explode", "allowReserved", "schema", "example", "examples",
                                  "content"}, path);

    Parameter parameter;
    parameter.name = codec::require_string(obj, "name", path);

    auto location_name = codec::require_string(obj, "in", path);
    auto location = SchemaContext::parse_location(location_name);
    if (!location)
        throw DecodeError(codec::join_path(path, "in"), fmt::format("unknown parameter location '{}'", location_name));
    parameter.location = *location;

    parameter.description = codec::get_string(obj, "description", path);
    parameter.required = codec::get_bool(obj, "required", path).value_or(false);
    parameter.deprecated = codec::get_bool(obj, "deprecated", path).value_or(false);
    parameter.allow_empty_value = codec::get_bool(obj, "allowEmptyValue", path).value_or(false);

    if (parameter.location == SchemaContext::PATH && !parameter.required)
        throw DecodeError(codec::join_path(path, "required"), "path parameters must be required");

    if (auto content = obj.get("content"); !content.is_nil()) {
        if (obj.contains("schema"))
            throw DecodeError(path, "'schema' and 'content' are mutually exclusive");
        auto content_map = codec::decode_content_map(content, codec::join_path(path, "content"));
        if (content_map.size() != 1)
            throw DecodeError(codec::join_path(path, "content"), "content map must hold exactly one media type");
        parameter.schema_or_content = std::move(content_map);
    } else {
        parameter.schema_or_content = SchemaContext::decode(obj, parameter.location, path);
    }

    parameter.extensions = codec::decode_extensions(obj);
    return parameter;
}

inline
Object Parameter::encode() const {
    Object obj{Object::MAP};
    obj.set("name", name);
    obj.set("in", String{SchemaContext::location_name(location)});
    if (description) obj.set("description", *description);
    if (required) obj.set("required", true);
    if (deprecated) obj.set("deprecated", true);
    if (allow_empty_value) obj.set("allowEmptyValue", true);

    if (auto p_context = schema_context())
        p_context->encode(obj);
    else
        obj.set("content", codec::encode_content_map(*content()));

    codec::encode_extensions(obj, extensions);
    return obj;
}

} // namespace apiref
