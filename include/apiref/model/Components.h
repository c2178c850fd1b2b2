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

#include <type_traits>
#include <variant>
#include <vector>

#include <apiref/core/Object.h>
#include <apiref/deref/ReferenceError.h>
#include <apiref/model/Content.h>
#include <apiref/model/Encoding.h>
#include <apiref/model/Example.h>
#include <apiref/model/Header.h>
#include <apiref/model/Parameter.h>
#include <apiref/model/Reference.h>
#include <apiref/model/RequestBody.h>
#include <apiref/model/Response.h>
#include <apiref/model/Schema.h>
#include <apiref/model/codec.h>
#include <apiref/support/logging.h>

namespace apiref {

//////////////////////////////////////////////////////////////////////////////
/// @brief Definitions store of a document (the "components" object).
/// Holds one insertion-ordered table per Category.  Names are unique within
/// a category.  Every resolution entry point takes the store by const
/// reference, so the store cannot change while a resolution is running.
//////////////////////////////////////////////////////////////////////////////
class Components
{
  public:
    /// Untyped result of lookup(Category, name).
    using Definition = std::variant<const Schema*, const Response*, const Parameter*,
                                    const Example*, const RequestBody*, const Header*>;

    Components() = default;

    template <typename T>
    Components& add(const String& name, T definition);

    template <typename T>
    const OrderedMap<T>& table() const;

    bool contains(Category category, const String& name) const;

    template <typename T>
    bool contains(const String& name) const { return table<T>().find(name) != table<T>().end(); }

    Definition lookup(Category category, const String& name) const;

    template <typename T>
    const T& get(const String& name) const;

    template <typename T>
    const T& lookup(const Reference<T>& ref) const;

    template <typename T>
    const T& lookup(const RefOr<T>& either) const;

    std::vector<String> names(Category category) const;
    size_t size() const;
    bool empty() const { return size() == 0; }

    const Extensions& extensions() const { return m_extensions; }

    static Components decode(const Object& obj, const String& path = "components");
    Object encode() const;

    bool operator == (const Components&) const = default;

  private:
    template <typename T>
    OrderedMap<T>& mutable_table() { return table_of<T>(*this); }

    // Selects the table for T, const or not as the store is.
    template <typename T, typename Self>
    static auto& table_of(Self& self);

    template <typename T, typename Func>
    void decode_table(const Object& obj, const String& path, Func&& decode_value);

  private:
    OrderedMap<Schema> m_schemas;
    OrderedMap<Response> m_responses;
    OrderedMap<Parameter> m_parameters;
    OrderedMap<Example> m_examples;
    OrderedMap<RequestBody> m_request_bodies;
    OrderedMap<Header> m_headers;
    Extensions m_extensions;
};


template <typename T, typename Self>
auto& Components::table_of(Self& self) {
    if constexpr (std::is_same<T, Schema>::value)           return self.m_schemas;
    else if constexpr (std::is_same<T, Response>::value)    return self.m_responses;
    else if constexpr (std::is_same<T, Parameter>::value)   return self.m_parameters;
    else if constexpr (std::is_same<T, Example>::value)     return self.m_examples;
    else if constexpr (std::is_same<T, RequestBody>::value) return self.m_request_bodies;
    else {
        static_assert(std::is_same<T, Header>::value, "type is not a components definition");
        return self.m_headers;
    }
}

template <typename T>
const OrderedMap<T>& Components::table() const {
    return table_of<T>(*this);
}

template <typename T>
Components& Components::add(const String& name, T definition) {
    auto& definitions = mutable_table<T>();
    if (definitions.find(name) != definitions.end())
        throw DuplicateDefinition(category_of<T>, name);
    definitions.insert({name, std::move(definition)});
    return *this;
}

inline
bool Components::contains(Category category, const String& name) const {
    switch (category) {
        case SCHEMAS:        return contains<Schema>(name);
        case RESPONSES:      return contains<Response>(name);
        case PARAMETERS:     return contains<Parameter>(name);
        case EXAMPLES:       return contains<Example>(name);
        case REQUEST_BODIES: return contains<RequestBody>(name);
        case HEADERS:        return contains<Header>(name);
    }
    return false;
}

template <typename T>
const T& Components::get(const String& name) const {
    auto& definitions = table<T>();
    auto it = definitions.find(name);
    if (it == definitions.end())
        throw NotFound(category_of<T>, name);
    return it->second;
}

inline
Components::Definition Components::lookup(Category category, const String& name) const {
    switch (category) {
        case SCHEMAS:        return &get<Schema>(name);
        case RESPONSES:      return &get<Response>(name);
        case PARAMETERS:     return &get<Parameter>(name);
        case EXAMPLES:       return &get<Example>(name);
        case REQUEST_BODIES: return &get<RequestBody>(name);
        case HEADERS:        return &get<Header>(name);
    }
    throw NotFound(category, name);
}

template <typename T>
const T& Components::lookup(const Reference<T>& ref) const {
    if (ref.is_remote())
        throw CannotResolveRemote(ref.locator());

    auto category = ref.category();
    if (category != category_of<T>) {
        if (contains(category, ref.name()))
            throw TypeMismatch(category, ref.name(), category_of<T>, category);
        throw NotFound(category, ref.name());
    }

    return get<T>(ref.name());
}

template <typename T>
const T& Components::lookup(const RefOr<T>& either) const {
    if (auto p_ref = std::get_if<Reference<T>>(&either))
        return lookup(*p_ref);
    return std::get<T>(either);
}

inline
std::vector<String> Components::names(Category category) const {
    std::vector<String> result;
    auto collect = [&result] (const auto& definitions) {
        for (auto& [name, definition] : definitions)
            result.push_back(name);
    };
    switch (category) {
        case SCHEMAS:        collect(m_schemas); break;
        case RESPONSES:      collect(m_responses); break;
        case PARAMETERS:     collect(m_parameters); break;
        case EXAMPLES:       collect(m_examples); break;
        case REQUEST_BODIES: collect(m_request_bodies); break;
        case HEADERS:        collect(m_headers); break;
    }
    return result;
}

inline
size_t Components::size() const {
    return m_schemas.size() + m_responses.size() + m_parameters.size() +
           m_examples.size() + m_request_bodies.size() + m_headers.size();
}

template <typename T, typename Func>
void Components::decode_table(const Object& obj, const String& path, Func&& decode_value) {
    auto name = String{category_name(category_of<T>)};
    auto definitions = obj.get(name);
    if (definitions.is_nil()) return;

    auto table_path = codec::join_path(path, name);
    codec::expect_map(definitions, table_path);
    for (auto& [key, value] : definitions.map())
        add<T>(key, decode_value(value, codec::join_path(table_path, key)));
}

inline
Components Components::decode(const Object& obj, const String& path) {
    codec::expect_map(obj, path);
    codec::log_ignored_keys(obj, {"schemas", "responses", "parameters", "examples", "requestBodies", "headers"}, path);

    Components components;
    components.decode_table<Schema>(obj, path, [] (const Object& value, const String& value_path) {
        return Schema::decode(value, value_path);
    });
    components.decode_table<Response>(obj, path, [] (const Object& value, const String& value_path) {
        return Response::decode(value, value_path);
    });
    components.decode_table<Parameter>(obj, path, [] (const Object& value, const String& value_path) {
        return Parameter::decode(value, value_path);
    });
    components.decode_table<Example>(obj, path, [] (const Object& value, const String& value_path) {
        return Example::decode(value, value_path);
    });
    components.decode_table<RequestBody>(obj, path, [] (const Object& value, const String& value_path) {
        return RequestBody::decode(value, value_path);
    });
    components.decode_table<Header>(obj, path, [] (const Object& value, const String& value_path) {
        return Header::decode(value, value_path);
    });
    components.m_extensions = codec::decode_extensions(obj);

    DEBUG("decoded {} definitions from '{}'", components.size(), path);
    return components;
}

inline
Object Components::encode() const {
    Object obj{Object::MAP};
    auto encode_table = [&obj] (Category category, const auto& definitions) {
        if (definitions.size() == 0) return;
        obj.set(String{category_name(category)}, codec::encode_map(definitions, [] (const auto& value) { return value.encode(); }));
    };
    encode_table(SCHEMAS, m_schemas);
    encode_table(RESPONSES, m_responses);
    encode_table(PARAMETERS, m_parameters);
    encode_table(EXAMPLES, m_examples);
    encode_table(REQUEST_BODIES, m_request_bodies);
    encode_table(HEADERS, m_headers);
    codec::encode_extensions(obj, m_extensions);
    return obj;
}

} // namespace apiref
