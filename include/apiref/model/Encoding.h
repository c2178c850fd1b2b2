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
#include <vector>

#include <apiref/core/Object.h>
#include <apiref/model/Header.h>
#include <apiref/model/Reference.h>
#include <apiref/model/SchemaContext.h>
#include <apiref/model/codec.h>

namespace apiref {

class Components;
class ResolutionContext;
class DereferencedEncoding;

//////////////////////////////////////////////////////////////////////////////
/// @brief Encoding object of a multipart or form-encoded media type property.
///
/// Serialized form:
/// - "contentType" holds all content types joined by ", ".
/// - "style", "explode" and "allowReserved" are omitted when they equal their
///   defaults: the query-location default style, that style's default
///   explode, and false.
/// - "x-" keys round-trip verbatim.  Other unrecognized keys are dropped.
//////////////////////////////////////////////////////////////////////////////
struct Encoding
{
    using Dereferenced = DereferencedEncoding;
    using Style = SchemaContext::Style;

    static constexpr Style default_style = SchemaContext::FORM;

    Encoding() = default;
    Encoding(std::vector<String> content_types, Style style = default_style,
             std::optional<bool> explode = std::nullopt, bool allow_reserved = false)
      : content_types{std::move(content_types)}, style{style},
        explode{explode.value_or(SchemaContext::default_explode(style))},
        allow_reserved{allow_reserved} {}

    std::vector<String> content_types;
    std::optional<HeaderMap> headers;
    Style style = default_style;
    bool explode = SchemaContext::default_explode(default_style);
    bool allow_reserved = false;
    Extensions extensions;

    /// The single content type, when exactly one is present.
    std::optional<String> content_type() const {
        if (content_types.size() != 1) return std::nullopt;
        return content_types.front();
    }

    DereferencedEncoding dereferenced(const Components&) const;
    DereferencedEncoding dereferenced(ResolutionContext&) const;

    static Encoding decode(const Object& obj, const String& path = "");
    Object encode() const;

    bool operator == (const Encoding&) const = default;
};


inline
Encoding Encoding::decode(const Object& obj, const String& path) {
    codec::expect_map(obj, path);
    codec::log_ignored_keys(obj, {"contentType", "headers", "style", "explode", "allowReserved"}, path);

    Encoding encoding;
    if (auto content_type = codec::get_string(obj, "contentType", path))
        encoding.content_types = split_trimmed(*content_type, ',');

    if (auto headers = obj.get("headers"); !headers.is_nil())
        encoding.headers = codec::decode_ref_or_map<Header>(headers, codec::join_path(path, "headers"));

    encoding.style = codec::get_style(obj, path).value_or(default_style);
    encoding.explode = codec::get_bool(obj, "explode", path).value_or(SchemaContext::default_explode(encoding.style));
    encoding.allow_reserved = codec::get_bool(obj, "allowReserved", path).value_or(false);
    encoding.extensions = codec::decode_extensions(obj);
    return encoding;
}

inline
Object Encoding::encode() const {
    Object obj{Object::MAP};
    if (content_types.size() > 0)
        obj.set("contentType", join(content_types, ", "));
    if (headers)
        obj.set("headers", codec::encode_ref_or_map(*headers));
    if (style != default_style)
        obj.set("style", String{SchemaContext::style_name(style)});
    if (explode != SchemaContext::default_explode(style))
        obj.set("explode", explode);
    if (allow_reserved)
        obj.set("allowReserved", true);
    codec::encode_extensions(obj, extensions);
    return obj;
}

} // namespace apiref
