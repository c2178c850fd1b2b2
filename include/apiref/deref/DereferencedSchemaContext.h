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

#include <apiref/deref/DereferencedSchema.h>
#include <apiref/deref/ResolutionContext.h>
#include <apiref/deref/examples.h>
#include <apiref/model/SchemaContext.h>

namespace apiref {

//////////////////////////////////////////////////////////////////////////////
/// @brief A SchemaContext with its schema and examples resolved.
/// example() is the derived example: the value of the first entry of the
/// examples map when it has one, otherwise the original single example.
//////////////////////////////////////////////////////////////////////////////
class DereferencedSchemaContext
{
  public:
    const SchemaContext& source() const { return m_source; }

    SchemaContext::Location location() const { return m_source.location; }
    SchemaContext::Style style() const       { return m_source.style; }
    bool explode() const                     { return m_source.explode; }
    bool allow_reserved() const              { return m_source.allow_reserved; }

    const DereferencedSchema& schema() const                         { return m_schema; }
    const std::optional<DereferencedExampleMap>& examples() const    { return m_examples; }
    const std::optional<Object>& example() const                     { return m_example; }

    SchemaContext inlined() const;

  private:
    DereferencedSchemaContext(const SchemaContext& source, DereferencedSchema&& schema,
                              std::optional<DereferencedExampleMap>&& examples)
      : m_source{source}, m_schema{std::move(schema)}, m_examples{std::move(examples)},
        m_example{impl::derive_example(m_examples, source.example)} {}

  private:
    SchemaContext m_source;
    DereferencedSchema m_schema;
    std::optional<DereferencedExampleMap> m_examples;
    std::optional<Object> m_example;

  friend struct SchemaContext;
};


inline
SchemaContext DereferencedSchemaContext::inlined() const {
    SchemaContext context = m_source;
    context.schema = m_schema.inlined();
    context.examples = impl::inline_examples(m_examples);
    context.example = impl::has_first_value(m_examples)? std::nullopt: m_example;
    return context;
}

inline
DereferencedSchemaContext SchemaContext::dereferenced(const Components& components) const {
    ResolutionContext context{components};
    return dereferenced(context);
}

inline
DereferencedSchemaContext SchemaContext::dereferenced(ResolutionContext& context) const {
    auto resolved_schema = schema.dereferenced(context);
    auto resolved_examples = impl::dereference_examples(examples, context);
    return {*this, std::move(resolved_schema), std::move(resolved_examples)};
}

} // namespace apiref
