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

#include <apiref/deref/DereferencedEncoding.h>
#include <apiref/deref/DereferencedSchema.h>
#include <apiref/deref/ResolutionContext.h>
#include <apiref/deref/examples.h>
#include <apiref/model/Content.h>

namespace apiref {

//////////////////////////////////////////////////////////////////////////////
/// @brief A media type object with its schema, examples and encodings
/// resolved.  The derived example follows the same rule as
/// DereferencedSchemaContext::example().
//////////////////////////////////////////////////////////////////////////////
class DereferencedContent
{
  public:
    const Content& source() const { return m_source; }

    const Extensions& extensions() const { return m_source.extensions; }

    const std::optional<DereferencedSchema>& schema() const                     { return m_schema; }
    const std::optional<DereferencedExampleMap>& examples() const               { return m_examples; }
    const std::optional<Object>& example() const                                { return m_example; }
    const std::optional<OrderedMap<DereferencedEncoding>>& encoding() const     { return m_encoding; }

    Content inlined() const;

  private:
    DereferencedContent(const Content& source) : m_source{source} { m_source.extensions = codec::copy(source.extensions); }

  private:
    Content m_source;
    std::optional<DereferencedSchema> m_schema;
    std::optional<DereferencedExampleMap> m_examples;
    std::optional<Object> m_example;
    std::optional<OrderedMap<DereferencedEncoding>> m_encoding;

  friend struct Content;
};

using DereferencedContentMap = OrderedMap<DereferencedContent>;


inline
Content DereferencedContent::inlined() const {
    Content content = m_source;
    if (m_schema) content.schema = m_schema->inlined();
    content.examples = impl::inline_examples(m_examples);
    content.example = impl::has_first_value(m_examples)? std::nullopt: m_example;
    if (m_encoding) {
        OrderedMap<Encoding> encoding;
        for (auto& [name, value] : *m_encoding)
            encoding.insert({name, value.inlined()});
        content.encoding = std::move(encoding);
    }
    return content;
}

namespace impl {

inline
DereferencedContentMap dereference_content(const ContentMap& content, ResolutionContext& context) {
    DereferencedContentMap result;
    for (auto& [media_type, value] : content)
        result.insert({media_type, value.dereferenced(context)});
    return result;
}

inline
ContentMap inline_content(const DereferencedContentMap& content) {
    ContentMap result;
    for (auto& [media_type, value] : content)
        result.insert({media_type, value.inlined()});
    return result;
}

} // namespace impl


inline
DereferencedContent Content::dereferenced(const Components& components) const {
    ResolutionContext context{components};
    return dereferenced(context);
}

inline
DereferencedContent Content::dereferenced(ResolutionContext& context) const {
    DereferencedContent result{*this};
    if (schema)
        result.m_schema = schema->dereferenced(context);

    result.m_examples = impl::dereference_examples(examples, context);
    result.m_example = impl::derive_example(result.m_examples, example);

    if (encoding) {
        OrderedMap<DereferencedEncoding> resolved;
        for (auto& [name, value] : *encoding)
            resolved.insert({name, value.dereferenced(context)});
        result.m_encoding = std::move(resolved);
    }
    return result;
}

} // namespace apiref
