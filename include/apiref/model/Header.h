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
#include <apiref/model/Reference.h>
#include <apiref/model/SchemaContext.h>
#include <apiref/model/codec.h>

namespace apiref {

class Components;
class ResolutionContext;
class DereferencedHeader;

//////////////////////////////////////////////////////////////////////////////
/// @brief Header object.
/// Only the schema form is modelled; a header described through a content
/// map is rejected by the decoder.
//////////////////////////////////////////////////////////////////////////////
struct Header
{
    using Dereferenced = DereferencedHeader;

    Header() : schema{Schema{}, SchemaContext::HEADER} {}
    Header(Schema schema) : schema{std::move(schema), SchemaContext::HEADER} {}

    std::optional<String> description;
    bool required = false;
    bool deprecated = false;
    SchemaContext schema;
    Extensions extensions;

    DereferencedHeader dereferenced(const Components&) const;
    DereferencedHeader dereferenced(ResolutionContext&) const;

    static Header decode(const Object& obj, const String& path = "");
    Object encode() const;

    bool operator == (const Header&) const = default;
};

using HeaderMap = OrderedMap<RefOr<Header>>;


inline
Header Header::decode(const Object& obj, const String& path) {
    codec::expect_map(obj, path);
    codec::log_ignored_keys(obj, {"description", "required", "deprecated", "style", "explode",
                                  "allowReserved", "schema", "example", "examples"}, path);

    if (obj.contains("content"))
        throw DecodeError(codec::join_path(path, "content"), "headers described by a content map are not supported");

    Header header;
    header.description = codec::get_string(obj, "description", path);
    header.required = codec::get_bool(obj, "required", path).value_or(false);
    header.deprecated = codec::get_bool(obj, "deprecated", path).value_or(false);
    header.schema = SchemaContext::decode(obj, SchemaContext::HEADER, path);
    header.extensions = codec::decode_extensions(obj);
    return header;
}

inline
Object Header::encode() const {
    Object obj{Object::MAP};
    if (description) obj.set("description", *description);
    if (required) obj.set("required", true);
    if (deprecated) obj.set("deprecated", true);
    schema.encode(obj);
    codec::encode_extensions(obj, extensions);
    return obj;
}

} // namespace apiref
