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

#include <apiref/deref/DereferencedSchemaContext.h>
#include <apiref/deref/ResolutionContext.h>
#include <apiref/model/Header.h>

namespace apiref {

class DereferencedHeader
{
  public:
    const Header& source() const { return m_source; }

    const std::optional<String>& description() const { return m_source.description; }
    bool required() const                            { return m_source.required; }
    bool deprecated() const                          { return m_source.deprecated; }
    const Extensions& extensions() const             { return m_source.extensions; }

    const DereferencedSchemaContext& schema() const { return m_schema; }

    Header inlined() const {
        Header header = m_source;
        header.schema = m_schema.inlined();
        return header;
    }

  private:
    DereferencedHeader(const Header& source, DereferencedSchemaContext&& schema)
      : m_source{source}, m_schema{std::move(schema)} { m_source.extensions = codec::copy(source.extensions); }

  private:
    Header m_source;
    DereferencedSchemaContext m_schema;

  friend struct Header;
};

using DereferencedHeaderMap = OrderedMap<DereferencedHeader>;


namespace impl {

inline
std::optional<DereferencedHeaderMap> dereference_headers(const std::optional<HeaderMap>& headers, ResolutionContext& context) {
    if (!headers) return std::nullopt;
    DereferencedHeaderMap result;
    for (auto& [name, header] : *headers)
        result.insert({name, context.dereference(header)});
    return result;
}

inline
std::optional<HeaderMap> inline_headers(const std::optional<DereferencedHeaderMap>& headers) {
    if (!headers) return std::nullopt;
    HeaderMap result;
    for (auto& [name, header] : *headers)
        result.insert({name, header.inlined()});
    return result;
}

} // namespace impl


inline
DereferencedHeader Header::dereferenced(const Components& components) const {
    ResolutionContext context{components};
    return dereferenced(context);
}

inline
DereferencedHeader Header::dereferenced(ResolutionContext& context) const {
    return {*this, schema.dereferenced(context)};
}

} // namespace apiref
