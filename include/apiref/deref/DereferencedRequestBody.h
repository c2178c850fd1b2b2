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
#include <apiref/deref/ResolutionContext.h>
#include <apiref/model/RequestBody.h>

namespace apiref {

class DereferencedRequestBody
{
  public:
    const RequestBody& source() const { return m_source; }

    const std::optional<String>& description() const { return m_source.description; }
    bool required() const                            { return m_source.required; }
    const Extensions& extensions() const             { return m_source.extensions; }

    const DereferencedContentMap& content() const { return m_content; }

    RequestBody inlined() const {
        RequestBody body = m_source;
        body.content = impl::inline_content(m_content);
        return body;
    }

  private:
    DereferencedRequestBody(const RequestBody& source, DereferencedContentMap&& content)
      : m_source{source}, m_content{std::move(content)} { m_source.extensions = codec::copy(source.extensions); }

  private:
    RequestBody m_source;
    DereferencedContentMap m_content;

  friend struct RequestBody;
};


inline
DereferencedRequestBody RequestBody::dereferenced(const Components& components) const {
    ResolutionContext context{components};
    return dereferenced(context);
}

inline
DereferencedRequestBody RequestBody::dereferenced(ResolutionContext& context) const {
    return {*this, impl::dereference_content(content, context)};
}

} // namespace apiref
