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

#include <apiref/deref/ResolutionContext.h>
#include <apiref/model/Schema.h>

namespace apiref {

class DereferencedSchema;
using DereferencedSchemaPtr = std::shared_ptr<const DereferencedSchema>;

//////////////////////////////////////////////////////////////////////////////
/// @brief A Schema with every reference in its subtree replaced by the
/// definition it names.
/// When the original schema was itself a reference, the wrapper holds the
/// resolved definition and reference() returns the reference it was reached
/// through.  Sub-schemas are shared and immutable.
//////////////////////////////////////////////////////////////////////////////
class DereferencedSchema
{
  public:
    /// The inline schema the non-resolved fields are read from.
    const Schema& source() const { return m_source; }

    const std::optional<Reference<Schema>>& reference() const { return m_reference; }

    const std::optional<String>& type() const        { return m_source.type; }
    const std::optional<String>& format() const      { return m_source.format; }
    const std::optional<String>& title() const       { return m_source.title; }
    const std::optional<String>& description() const { return m_source.description; }
    bool nullable() const                            { return m_source.nullable; }
    bool deprecated() const                          { return m_source.deprecated; }
    bool read_only() const                           { return m_source.read_only; }
    bool write_only() const                          { return m_source.write_only; }
    const std::vector<String>& required() const      { return m_source.required; }
    const List& enum_values() const                  { return m_source.enum_values; }
    const std::optional<Object>& default_value() const { return m_source.default_value; }
    const std::optional<Object>& example() const     { return m_source.example; }
    const Extensions& extensions() const             { return m_source.extensions; }

    const std::optional<bool>& additional_properties_allowed() const { return m_source.additional_properties_allowed; }

    const OrderedMap<DereferencedSchemaPtr>& properties() const { return m_properties; }
    const DereferencedSchemaPtr& property(const String& name) const;
    const DereferencedSchemaPtr& items() const                  { return m_items; }
    const DereferencedSchemaPtr& additional_properties() const  { return m_additional_properties; }
    const std::vector<DereferencedSchemaPtr>& all_of() const    { return m_all_of; }
    const std::vector<DereferencedSchemaPtr>& one_of() const    { return m_one_of; }
    const std::vector<DereferencedSchemaPtr>& any_of() const    { return m_any_of; }
    const DereferencedSchemaPtr& not_schema() const             { return m_not_schema; }

    Schema inlined() const;
    Object encode() const { return inlined().encode(); }

  private:
    DereferencedSchema(const Schema& source);

    static DereferencedSchemaPtr share(const SchemaPtr& schema, ResolutionContext& context);
    static std::vector<DereferencedSchemaPtr> share(const std::vector<SchemaPtr>& schemas, ResolutionContext& context);

  private:
    Schema m_source;
    std::optional<Reference<Schema>> m_reference;
    OrderedMap<DereferencedSchemaPtr> m_properties;
    DereferencedSchemaPtr m_items;
    DereferencedSchemaPtr m_additional_properties;
    std::vector<DereferencedSchemaPtr> m_all_of;
    std::vector<DereferencedSchemaPtr> m_one_of;
    std::vector<DereferencedSchemaPtr> m_any_of;
    DereferencedSchemaPtr m_not_schema;

  friend struct Schema;
};


inline
DereferencedSchema::DereferencedSchema(const Schema& source) : m_source{source} {
    m_source.enum_values = codec::copy(source.enum_values);
    m_source.default_value = codec::copy(source.default_value);
    m_source.example = codec::copy(source.example);
    m_source.extensions = codec::copy(source.extensions);
}

inline
DereferencedSchemaPtr DereferencedSchema::share(const SchemaPtr& schema, ResolutionContext& context) {
    if (!schema) return nullptr;
    return std::make_shared<const DereferencedSchema>(schema->dereferenced(context));
}

inline
std::vector<DereferencedSchemaPtr> DereferencedSchema::share(const std::vector<SchemaPtr>& schemas, ResolutionContext& context) {
    std::vector<DereferencedSchemaPtr> result;
    for (auto& schema : schemas)
        result.push_back(share(schema, context));
    return result;
}

inline
const DereferencedSchemaPtr& DereferencedSchema::property(const String& name) const {
    auto it = m_properties.find(name);
    if (it == m_properties.end())
        throw ApirefException(fmt::format("schema has no property '{}'", name));
    return it->second;
}

inline
Schema DereferencedSchema::inlined() const {
    auto inline_schema = [] (const DereferencedSchemaPtr& schema) -> SchemaPtr {
        if (!schema) return nullptr;
        return Schema::share(schema->inlined());
    };

    auto inline_schemas = [&inline_schema] (const std::vector<DereferencedSchemaPtr>& schemas) {
        std::vector<SchemaPtr> result;
        for (auto& schema : schemas)
            result.push_back(inline_schema(schema));
        return result;
    };

    Schema schema = m_source;
    schema.properties.clear();
    for (auto& [name, property] : m_properties)
        schema.properties.insert({name, inline_schema(property)});
    schema.items = inline_schema(m_items);
    schema.additional_properties = inline_schema(m_additional_properties);
    schema.all_of = inline_schemas(m_all_of);
    schema.one_of = inline_schemas(m_one_of);
    schema.any_of = inline_schemas(m_any_of);
    schema.not_schema = inline_schema(m_not_schema);
    return schema;
}

inline
DereferencedSchema Schema::dereferenced(const Components& components) const {
    ResolutionContext context{components};
    return dereferenced(context);
}

inline
DereferencedSchema Schema::dereferenced(ResolutionContext& context) const {
    if (ref) {
        auto result = context.dereference(*ref);
        result.m_reference = *ref;
        return result;
    }

    DereferencedSchema result{*this};
    for (auto& [name, property] : properties)
        result.m_properties.insert({name, DereferencedSchema::share(property, context)});
    result.m_items = DereferencedSchema::share(items, context);
    result.m_additional_properties = DereferencedSchema::share(additional_properties, context);
    result.m_all_of = DereferencedSchema::share(all_of, context);
    result.m_one_of = DereferencedSchema::share(one_of, context);
    result.m_any_of = DereferencedSchema::share(any_of, context);
    result.m_not_schema = DereferencedSchema::share(not_schema, context);
    return result;
}

} // namespace apiref
