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

#include <memory>
#include <optional>
#include <vector>

#include <apiref/core/Object.h>
#include <apiref/model/Reference.h>
#include <apiref/model/codec.h>

namespace apiref {

class Components;
class ResolutionContext;
class DereferencedSchema;

struct Schema;
using SchemaPtr = std::shared_ptr<const Schema>;

//////////////////////////////////////////////////////////////////////////////
/// @brief JSON Schema node.
/// A schema is either a reference ($ref), in which case every other field is
/// ignored, or an inline schema whose sub-schemas may themselves be
/// references at any depth.  Sub-schemas are shared and immutable.
//////////////////////////////////////////////////////////////////////////////
struct Schema
{
    using Dereferenced = DereferencedSchema;

    std::optional<Reference<Schema>> ref;

    std::optional<String> type;
    std::optional<String> format;
    std::optional<String> title;
    std::optional<String> description;
    bool nullable = false;
    bool deprecated = false;
    bool read_only = false;
    bool write_only = false;

    std::vector<String> required;
    OrderedMap<SchemaPtr> properties;
    SchemaPtr items;
    std::optional<bool> additional_properties_allowed;
    SchemaPtr additional_properties;

    std::vector<SchemaPtr> all_of;
    std::vector<SchemaPtr> one_of;
    std::vector<SchemaPtr> any_of;
    SchemaPtr not_schema;

    List enum_values;
    std::optional<Object> default_value;
    std::optional<Object> example;
    Extensions extensions;

    static Schema reference(const Reference<Schema>& ref) { Schema schema; schema.ref = ref; return schema; }
    static Schema reference(const String& name)           { return reference(Reference<Schema>::local(name)); }
    static Schema of_type(const String& type)             { Schema schema; schema.type = type; return schema; }

    static SchemaPtr share(Schema schema) { return std::make_shared<const Schema>(std::move(schema)); }

    bool is_reference() const { return ref.has_value(); }

    DereferencedSchema dereferenced(const Components&) const;
    DereferencedSchema dereferenced(ResolutionContext&) const;

    static Schema decode(const Object& obj, const String& path = "");
    Object encode() const;

    bool operator == (const Schema&) const;
};


namespace impl {

inline
bool same_schema(const SchemaPtr& lhs, const SchemaPtr& rhs) {
    if (lhs == rhs) return true;
    if (!lhs || !rhs) return false;
    return *lhs == *rhs;
}

inline
bool same_schemas(const std::vector<SchemaPtr>& lhs, const std::vector<SchemaPtr>& rhs) {
    if (lhs.size() != rhs.size()) return false;
    for (size_t i = 0; i < lhs.size(); ++i) {
        if (!same_schema(lhs[i], rhs[i])) return false;
    }
    return true;
}

inline
std::vector<SchemaPtr> decode_schema_list(const Object& obj, const String& path) {
    if (!obj.is_list())
        throw DecodeError(path, fmt::format("expected list, found {}", obj.type_name()));
    std::vector<SchemaPtr> schemas;
    size_t index = 0;
    for (auto& item : obj.list())
        schemas.push_back(Schema::share(Schema::decode(item, path + "[" + int_to_str(index++) + "]")));
    return schemas;
}

inline
Object encode_schema_list(const std::vector<SchemaPtr>& schemas) {
    Object list{Object::LIST};
    for (auto& schema : schemas)
        list.push_back(schema->encode());
    return list;
}

} // namespace impl


inline
bool Schema::operator == (const Schema& other) const {
    if (ref != other.ref) return false;
    if (is_reference()) return true;

    if (properties.size() != other.properties.size()) return false;
    auto it = properties.begin();
    auto other_it = other.properties.begin();
    for (; it != properties.end(); ++it, ++other_it) {
        if (it->first != other_it->first || !impl::same_schema(it->second, other_it->second))
            return false;
    }

    return type == other.type &&
           format == other.format &&
           title == other.title &&
           description == other.description &&
           nullable == other.nullable &&
           deprecated == other.deprecated &&
           read_only == other.read_only &&
           write_only == other.write_only &&
           required == other.required &&
           impl::same_schema(items, other.items) &&
           additional_properties_allowed == other.additional_properties_allowed &&
           impl::same_schema(additional_properties, other.additional_properties) &&
           impl::same_schemas(all_of, other.all_of) &&
           impl::same_schemas(one_of, other.one_of) &&
           impl::same_schemas(any_of, other.any_of) &&
           impl::same_schema(not_schema, other.not_schema) &&
           enum_values == other.enum_values &&
           default_value == other.default_value &&
           example == other.example &&
           extensions == other.extensions;
}

inline
Schema Schema::decode(const Object& obj, const String& path) {
    codec::expect_map(obj, path);

    if (codec::is_reference_object(obj))
        return reference(Reference<Schema>::decode(obj, path));

    codec::log_ignored_keys(obj, {"type", "format", "title", "description", "nullable", "deprecated",
                                  "readOnly", "writeOnly", "required", "properties", "items",
                                  "additionalProperties", "allOf", "oneOf", "anyOf", "not", "enum",
                                  "default", "example"}, path);

    Schema schema;
    schema.type = codec::get_string(obj, "type", path);
    schema.format = codec::get_string(obj, "format", path);
    schema.title = codec::get_string(obj, "title", path);
    schema.description = codec::get_string(obj, "description", path);
    schema.nullable = codec::get_bool(obj, "nullable", path).value_or(false);
    schema.deprecated = codec::get_bool(obj, "deprecated", path).value_or(false);
    schema.read_only = codec::get_bool(obj, "readOnly", path).value_or(false);
    schema.write_only = codec::get_bool(obj, "writeOnly", path).value_or(false);

    if (auto required = obj.get("required"); !required.is_nil()) {
        auto required_path = codec::join_path(path, "required");
        if (!required.is_list())
            throw DecodeError(required_path, "expected list of property names");
        for (auto& name : required.list()) {
            if (!name.is_str())
                throw DecodeError(required_path, fmt::format("expected string, found {}", name.type_name()));
            schema.required.push_back(name.as<String>());
        }
    }

    if (auto properties = obj.get("properties"); !properties.is_nil()) {
        schema.properties = codec::decode_map<SchemaPtr>(properties, codec::join_path(path, "properties"),
            [] (const Object& value, const String& value_path) { return share(decode(value, value_path)); });
    }

    if (auto items = obj.get("items"); !items.is_nil())
        schema.items = share(decode(items, codec::join_path(path, "items")));

    if (auto additional = obj.get("additionalProperties"); !additional.is_nil()) {
        if (additional.is_bool())
            schema.additional_properties_allowed = additional.as<bool>();
        else
            schema.additional_properties = share(decode(additional, codec::join_path(path, "additionalProperties")));
    }

    if (auto all_of = obj.get("allOf"); !all_of.is_nil())
        schema.all_of = impl::decode_schema_list(all_of, codec::join_path(path, "allOf"));
    if (auto one_of = obj.get("oneOf"); !one_of.is_nil())
        schema.one_of = impl::decode_schema_list(one_of, codec::join_path(path, "oneOf"));
    if (auto any_of = obj.get("anyOf"); !any_of.is_nil())
        schema.any_of = impl::decode_schema_list(any_of, codec::join_path(path, "anyOf"));
    if (auto not_schema = obj.get("not"); !not_schema.is_nil())
        schema.not_schema = share(decode(not_schema, codec::join_path(path, "not")));

    if (auto enum_values = obj.get("enum"); !enum_values.is_nil()) {
        if (!enum_values.is_list())
            throw DecodeError(codec::join_path(path, "enum"), "expected list");
        schema.enum_values = enum_values.list();
    }

    schema.default_value = codec::get_any(obj, "default");
    schema.example = codec::get_any(obj, "example");
    schema.extensions = codec::decode_extensions(obj);
    return schema;
}

inline
Object Schema::encode() const {
    if (ref) return ref->encode();

    Object obj{Object::MAP};
    if (type) obj.set("type", *type);
    if (format) obj.set("format", *format);
    if (title) obj.set("title", *title);
    if (description) obj.set("description", *description);
    if (nullable) obj.set("nullable", true);
    if (deprecated) obj.set("deprecated", true);
    if (read_only) obj.set("readOnly", true);
    if (write_only) obj.set("writeOnly", true);

    if (required.size() > 0) {
        Object names{Object::LIST};
        for (auto& name : required) names.push_back(name);
        obj.set("required", names);
    }

    if (properties.size() > 0)
        obj.set("properties", codec::encode_map(properties, [] (const SchemaPtr& value) { return value->encode(); }));

    if (items) obj.set("items", items->encode());

    if (additional_properties)
        obj.set("additionalProperties", additional_properties->encode());
    else if (additional_properties_allowed)
        obj.set("additionalProperties", *additional_properties_allowed);

    if (all_of.size() > 0) obj.set("allOf", impl::encode_schema_list(all_of));
    if (one_of.size() > 0) obj.set("oneOf", impl::encode_schema_list(one_of));
    if (any_of.size() > 0) obj.set("anyOf", impl::encode_schema_list(any_of));
    if (not_schema) obj.set("not", not_schema->encode());

    if (enum_values.size() > 0) obj.set("enum", enum_values);
    if (default_value) obj.set("default", *default_value);
    if (example) obj.set("example", *example);
    codec::encode_extensions(obj, extensions);
    return obj;
}

} // namespace apiref
