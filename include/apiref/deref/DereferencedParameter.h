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
#include <variant>

#include <apiref/deref/DereferencedContent.h>
#include <apiref/deref/DereferencedSchemaContext.h>
#include <apiref/deref/ResolutionContext.h>
#include <apiref/model/Parameter.h>

namespace apiref {

class DereferencedParameter
{
  public:
    const Parameter& source() const { return m_source; }

    const String& name() const                       { return m_source.name; }
    Parameter::Location location() const             { return m_source.location; }
    const std::optional<String>& description() const { return m_source.description; }
    bool required() const                            { return m_source.required; }
    bool deprecated() const                          { return m_source.deprecated; }
    bool allow_empty_value() const                   { return m_source.allow_empty_value; }
    const Extensions& extensions() const             { return m_source.extensions; }

    /// The resolved schema context, or nullptr when described by content.
    const DereferencedSchemaContext* schema_context() const { return std::get_if<DereferencedSchemaContext>(&m_schema_or_content); }
    const DereferencedContentMap* content() const           { return std::get_if<DereferencedContentMap>(&m_schema_or_content); }

    Parameter inlined() const {
        Parameter parameter = m_source;
        if (auto p_context = schema_context())
            parameter.schema_or_content = p_context->inlined();
        else
            parameter.schema_or_content = impl::inline_content(*content());
        return parameter;
    }

  private:
    using SchemaOrContent = std::variant<DereferencedSchemaContext, DereferencedContentMap>;

    DereferencedParameter(const Parameter& source, SchemaOrContent&& schema_or_content)
      : m_source{source}, m_schema_or_content{std::move(schema_or_content)} { m_source.extensions = codec::copy(source.extensions); }

  private:
    Parameter m_source;
    SchemaOrContent m_schema_or_content;

  friend struct Parameter;
};


inline
DereferencedParameter Parameter::dereferenced(const Components& components) const {
    ResolutionContext context{components};
    return dereferenced(context);
}

inline
DereferencedParameter Parameter::dereferenced(ResolutionContext& context) const {
    if (auto p_context = schema_context())
        return {*this, p_context->dereferenced(context)};
    return {*this, impl::dereference_content(*content(), context)};
}

} // namespace apiref
