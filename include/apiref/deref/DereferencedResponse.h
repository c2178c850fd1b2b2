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

#include <apiref/deref/DereferencedContent.h>
#include <apiref/deref/DereferencedHeader.h>
#include <apiref/deref/ResolutionContext.h>
#include <apiref/model/Response.h>

namespace apiref {

class DereferencedResponse
{
  public:
    const Response& source() const { return m_source; }

    const String& description() const    { return m_source.description; }
    const Extensions& extensions() const { return m_source.extensions; }

    const std::optional<DereferencedHeaderMap>& headers() const { return m_headers; }
    const DereferencedContentMap& content() const               { return m_content; }

    Response inlined() const {
        Response response = m_source;
        response.headers = impl::inline_headers(m_headers);
        response.content = impl::inline_content(m_content);
        return response;
    }

  private:
    DereferencedResponse(const Response& source, std::optional<DereferencedHeaderMap>&& headers,
                         DereferencedContentMap&& content)
      : m_source{source}, m_headers{std::move(headers)}, m_content{std::move(content)} { m_source.extensions = codec::copy(source.extensions); }

  private:
    Response m_source;
    std::optional<DereferencedHeaderMap> m_headers;
    DereferencedContentMap m_content;

  friend struct Response;
};


inline
DereferencedResponse Response::dereferenced(const Components& components) const {
    ResolutionContext context{components};
    return dereferenced(context);
}

inline
DereferencedResponse Response::dereferenced(ResolutionContext& context) const {
    auto resolved_headers = impl::dereference_headers(headers, context);
    return {*this, std::move(resolved_headers), impl::dereference_content(content, context)};
}

} // namespace apiref
