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
#include <apiref/model/Content.h>
#include <apiref/model/codec.h>

namespace apiref {

class Components;
class ResolutionContext;
class DereferencedRequestBody;

struct RequestBody
{
    using Dereferenced = DereferencedRequestBody;

    std::optional<String> description;
    ContentMap content;
    bool required = false;
    Extensions extensions;

    DereferencedRequestBody dereferenced(const Components&) const;
    DereferencedRequestBody dereferenced(ResolutionContext&) const;

    static RequestBody decode(const Object& obj, const String& path = "");
    Object encode() const;

    bool operator == (const RequestBody&) const = default;
};


inline
RequestBody RequestBody::decode(const Object& obj, const String& path) {
    codec::expect_map(obj, path);
    codec::log_ignored_keys(obj, {"description", "content", "required"}, path);

    auto content = obj.get("content");
    if (content.is_nil())
        throw DecodeError(codec::join_path(path, "content"), "required field is missing");

    RequestBody body;
    body.description = codec::get_string(obj, "description", path);
    body.content = codec::decode_content_map(content, codec::join_path(path, "content"));
    body.required = codec::get_bool(obj, "required", path).value_or(false);
    body.extensions = codec::decode_extensions(obj);
    return body;
}

inline
Object RequestBody::encode() const {
    Object obj{Object::MAP};
    if (description) obj.set("description", *description);
    obj.set("content", codec::encode_content_map(content));
    if (required) obj.set("required", true);
    codec::encode_extensions(obj, extensions);
    return obj;
}

} // namespace apiref
