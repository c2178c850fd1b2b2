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

#include <algorithm>
#include <initializer_list>
#include <optional>
#include <vector>

#include <apiref/core/Object.h>
#include <apiref/model/Reference.h>
#include <apiref/support/exception.h>
#include <apiref/support/logging.h>
#include <apiref/support/string.h>

namespace apiref {

/// Vendor extensions ("x-" prefixed keys), in document order.
using Extensions = OrderedMap<Object>;

namespace codec {

constexpr std::string_view extension_prefix = "x-";

inline
bool is_extension_key(const StringView& key) { return starts_with(key, extension_prefix); }

inline
String join_path(const String& path, const StringView& key) {
    if (path.size() == 0) return String{key};
    String out{path};
    out.push_back('.');
    out += key;
    return out;
}

inline
void expect_map(const Object& obj, const String& path) {
    if (!obj.is_map())
        throw DecodeError(path, fmt::format("expected map, found {}", obj.type_name()));
}

inline
std::optional<String> get_string(const Object& obj, const char* key, const String& path) {
    auto value = obj.get(key);
    if (value.is_nil()) return std::nullopt;
    if (!value.is_str())
        throw DecodeError(join_path(path, key), fmt::format("expected string, found {}", value.type_name()));
    return value.as<String>();
}

inline
String require_string(const Object& obj, const char* key, const String& path) {
    auto value = get_string(obj, key, path);
    if (!value) throw DecodeError(join_path(path, key), "required field is missing");
    return *value;
}

inline
std::optional<bool> get_bool(const Object& obj, const char* key, const String& path) {
    auto value = obj.get(key);
    if (value.is_nil()) return std::nullopt;
    if (!value.is_bool())
        throw DecodeError(join_path(path, key), fmt::format("expected bool, found {}", value.type_name()));
    return value.as<bool>();
}

inline
std::optional<Object> get_any(const Object& obj, const char* key) {
    if (!obj.contains(key)) return std::nullopt;
    return obj.get(key);
}

inline
bool is_reference_object(const Object& obj) {
    return obj.is_map() && obj.contains("$ref");
}

inline
Extensions decode_extensions(const Object& obj) {
    Extensions extensions;
    for (auto& [key, value] : obj.map()) {
        if (is_extension_key(key))
            extensions.insert({key, value});
    }
    return extensions;
}

inline
void encode_extensions(Object& obj, const Extensions& extensions) {
    for (auto& [key, value] : extensions)
        obj.set(key, value);
}

// Copies of list and map Objects share storage, so values handed out of a
// definition are deep copies.
inline
std::optional<Object> copy(const std::optional<Object>& value) {
    if (!value) return std::nullopt;
    return value->copy();
}

inline
List copy(const List& values) {
    List result;
    for (auto& value : values)
        result.push_back(value.copy());
    return result;
}

inline
Extensions copy(const Extensions& extensions) {
    Extensions result;
    for (auto& [key, value] : extensions)
        result.insert({key, value.copy()});
    return result;
}

// Keys that are neither recognized nor extensions are dropped from the model.
inline
void log_ignored_keys(const Object& obj, std::initializer_list<StringView> known, const String& path) {
    for (auto& [key, value] : obj.map()) {
        if (is_extension_key(key)) continue;
        if (std::find(known.begin(), known.end(), StringView{key}) == known.end()) {
            DEBUG("ignoring unrecognized key '{}' at '{}'", key, path);
        }
    }
}

template <typename T>
RefOr<T> decode_ref_or(const Object& obj, const String& path) {
    if (is_reference_object(obj))
        return Reference<T>::decode(obj, path);
    return T::decode(obj, path);
}

template <typename T>
Object encode_ref_or(const RefOr<T>& either) {
    if (auto p_ref = std::get_if<Reference<T>>(&either))
        return p_ref->encode();
    return std::get<T>(either).encode();
}

template <typename T, typename Func>
OrderedMap<T> decode_map(const Object& obj, const String& path, Func&& decode_value) {
    expect_map(obj, path);
    OrderedMap<T> result;
    for (auto& [key, value] : obj.map())
        result.insert({key, decode_value(value, join_path(path, key))});
    return result;
}

template <typename T, typename Func>
Object encode_map(const OrderedMap<T>& map, Func&& encode_value) {
    Object obj{Object::MAP};
    for (auto& [key, value] : map)
        obj.set(key, encode_value(value));
    return obj;
}

template <typename T>
OrderedMap<RefOr<T>> decode_ref_or_map(const Object& obj, const String& path) {
    return decode_map<RefOr<T>>(obj, path, [] (const Object& value, const String& value_path) {
        return decode_ref_or<T>(value, value_path);
    });
}

template <typename T>
Object encode_ref_or_map(const OrderedMap<RefOr<T>>& map) {
    return encode_map(map, [] (const RefOr<T>& value) { return encode_ref_or(value); });
}

} // namespace codec
} // namespace apiref
