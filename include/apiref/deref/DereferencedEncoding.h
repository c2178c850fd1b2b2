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
#include <vector>

#include <apiref/deref/DereferencedHeader.h>
#include <apiref/deref/ResolutionContext.h>
#include <apiref/model/Encoding.h>

namespace apiref {

class DereferencedEncoding
{
  public:
    const Encoding& source() const { return m_source; }

    const std::vector<String>& content_types() const { return m_source.content_types; }
    std::optional<String> content_type() const       { return m_source.content_type(); }
    Encoding::Style style() const                    { return m_source.style; }
    bool explode() const                             { return m_source.explode; }
    bool allow_reserved() const                      { return m_source.allow_reserved; }
    const Extensions& extensions() const             { return m_source.extensions; }

    const std::optional<DereferencedHeaderMap>& headers() const { return m_headers; }

    Encoding inlined() const {
        Encoding encoding = m_source;
        encoding.headers = impl::inline_headers(m_headers);
        return encoding;
    }

  private:
    DereferencedEncoding(const Encoding& source, std::optional<DereferencedHeaderMap>&& headers)
      : m_source{source}, m_headers{std::move(headers)} { m_source.extensions = codec::copy(source.extensions); }

  private:
    Encoding m_source;
    std::optional<DereferencedHeaderMap> m_headers;

  friend struct Encoding;
};


inline
DereferencedEncoding Encoding::dereferenced(const Components& components) const {
    ResolutionContext context{components};
    return dereferenced(context);
}

inline
DereferencedEncoding Encoding::dereferenced(ResolutionContext& context) const {
    return {*this, impl::dereference_headers(headers, context)};
}

} // namespace apiref
