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
#include <apiref/model/Header.h>
#include <apiref/model/codec.h>

namespace apiref {

class Components;
class ResolutionContext;
class DereferencedResponse;

struct Response
{
    using Dereferenced = DereferencedResponse;

    String description;
    std::optional<HeaderMap> headers;
    ContentMap content;
    Extensions extensions;

    DereferencedResponse dereferenced(const Components&) const;
    DereferencedResponse dereferenced(ResolutionContext&) const;

    static Response decode(const Object& obj, const String& path = "");
    Object encode() const;

    bool operator == (const Response&) const = default;
};


inline
Response Response::decode(const Object& obj, const String& path) {
    codec::expect_map(obj, path);
    codec::log_ignored_keys(obj, {"description", "headers", "content"}, path);

    Response response;
    response.description = codec::require_string(obj, "description", path);

    if (auto headers = obj.get("headers"); !headers.is_nil())
        response.headers = codec::decode_ref_or_map<Header>(headers, codec::join_path(path, "headers"));

    if (auto content = obj.get("content"); !content.is_nil())
        response.content = codec::decode_content_map(content, codec::join_path(path, "content"));

    response.extensions = codec::decode_extensions(obj);
    return response;
}

inline
Object Response::encode() const {
    Object obj{Object::MAP};
    obj.set("description", description);
    if (headers) obj.set("headers", codec::encode_ref_or_map(*headers));
    if (content.size() > 0) obj.set("content", codec::encode_content_map(content));
    codec::encode_extensions(obj, extensions);
    return obj;
}

} // namespace apiref
