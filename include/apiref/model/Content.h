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
#include <apiref/model/Encoding.h>
#include <apiref/model/Example.h>
#include <apiref/model/Schema.h>
#include <apiref/model/codec.h>

namespace apiref {

class Components;
class ResolutionContext;
class DereferencedContent;

/// Media type object: the description of one content type of a body,
/// response or parameter.
struct Content
{
    using Dereferenced = DereferencedContent;

    std::optional<Schema> schema;
    std::optional<Object> example;
    std::optional<ExampleMap> examples;
    std::optional<OrderedMap<Encoding>> encoding;
    Extensions extensions;

    DereferencedContent dereferenced(const Components&) const;
    DereferencedContent dereferenced(ResolutionContext&) const;

    static Content decode(const Object& obj, const String& path = "");
    Object encode() const;

    bool operator == (const Content&) const = default;
};

/// Content type (e.g. "application/json") to media type object.
using ContentMap = OrderedMap<Content>;


inline
Content Content::decode(const Object& obj, const String& path) {
    codec::expect_map(obj, path);
    codec::log_ignored_keys(obj, {"schema", "example", "examples", "encoding"}, path);

    Content content;
    if (auto schema = obj.get("schema"); !schema.is_nil())
        content.schema = Schema::decode(schema, codec::join_path(path, "schema"));

    content.example = codec::get_any(obj, "example");

    if (auto examples = obj.get("examples"); !examples.is_nil())
        content.examples = codec::decode_ref_or_map<Example>(examples, codec::join_path(path, "examples"));

    if (auto encoding = obj.get("encoding"); !encoding.is_nil()) {
        content.encoding = codec::decode_map<Encoding>(encoding, codec::join_path(path, "encoding"),
            [] (const Object& value, const String& value_path) { return Encoding::decode(value, value_path); });
    }

    content.extensions = codec::decode_extensions(obj);
    return content;
}

inline
Object Content::encode() const {
    Object obj{Object::MAP};
    if (schema) obj.set("schema", schema->encode());
    if (example) obj.set("example", *example);
    if (examples) obj.set("examples", codec::encode_ref_or_map(*examples));
    if (encoding) obj.set("encoding", codec::encode_map(*encoding, [] (const Encoding& value) { return value.encode(); }));
    codec::encode_extensions(obj, extensions);
    return obj;
}

namespace codec {

inline
ContentMap decode_content_map(const Object& obj, const String& path) {
    return decode_map<Content>(obj, path, [] (const Object& value, const String& value_path) {
        return Content::decode(value, value_path);
    });
}

inline
Object encode_content_map(const ContentMap& content) {
    return encode_map(content, [] (const Content& value) { return value.encode(); });
}

} // namespace codec
} // namespace apiref
