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
#include <apiref/model/codec.h>

namespace apiref {

class Components;
class ResolutionContext;

//////////////////////////////////////////////////////////////////////////////
/// @brief Example object.
/// Holds either an inline value or the URL of an external value.  Examples
/// contain no references, so an Example is its own dereferenced form.
//////////////////////////////////////////////////////////////////////////////
struct Example
{
    using Dereferenced = Example;

    std::optional<String> summary;
    std::optional<String> description;
    std::optional<Object> value;
    std::optional<String> external_value;
    Extensions extensions;

    Example dereferenced(const Components&) const { return copy(); }
    Example dereferenced(ResolutionContext&) const { return copy(); }

    /// Returns an Example whose value and extensions share no storage with this one.
    Example copy() const;

    static Example decode(const Object& obj, const String& path = "");
    Object encode() const;

    bool operator == (const Example&) const = default;
};

using ExampleMap = OrderedMap<RefOr<Example>>;


inline
Example Example::decode(const Object& obj, const String& path) {
    codec::expect_map(obj, path);
    codec::log_ignored_keys(obj, {"summary", "description", "value", "externalValue"}, path);

    Example example;
    example.summary = codec::get_string(obj, "summary", path);
    example.description = codec::get_string(obj, "description", path);
    example.value = codec::get_any(obj, "value");
    example.external_value = codec::get_string(obj, "externalValue", path);
    example.extensions = codec::decode_extensions(obj);

    if (example.value && example.external_value)
        throw DecodeError(path, "'value' and 'externalValue' are mutually exclusive");

    return example;
}

inline
Example Example::copy() const {
    Example example = *this;
    example.value = codec::copy(value);
    example.extensions = codec::copy(extensions);
    return example;
}

inline
Object Example::encode() const {
    Object obj{Object::MAP};
    if (summary) obj.set("summary", *summary);
    if (description) obj.set("description", *description);
    if (value) obj.set("value", *value);
    if (external_value) obj.set("externalValue", *external_value);
    codec::encode_extensions(obj, extensions);
    return obj;
}

} // namespace apiref
