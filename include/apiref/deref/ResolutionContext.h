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

#include <set>
#include <utility>
#include <variant>

#include <apiref/deref/ReferenceError.h>
#include <apiref/model/Components.h>
#include <apiref/model/Reference.h>
#include <apiref/support/logging.h>

namespace apiref {

//////////////////////////////////////////////////////////////////////////////
/// @brief State of one top-level dereference call.
/// Holds the definitions store and the set of definitions currently being
/// resolved.  A definition is in the set only while its own resolution is
/// running, so sibling references to the same definition are allowed, while
/// a definition that reaches itself is rejected with RecursiveReference.
/// The set is empty again after every call, successful or not.
//////////////////////////////////////////////////////////////////////////////
class ResolutionContext
{
  public:
    using Key = std::pair<Category, String>;

    /// Membership of one definition in the in-progress set.
    class Entry
    {
      public:
        Entry(Entry&& other) : mp_context{other.mp_context}, m_key{std::move(other.m_key)} { other.mp_context = nullptr; }
        ~Entry() { if (mp_context != nullptr) mp_context->leave(m_key); }

        Entry(const Entry&) = delete;
        Entry& operator = (const Entry&) = delete;
        Entry& operator = (Entry&&) = delete;

      private:
        Entry(ResolutionContext& context, const Key& key) : mp_context{&context}, m_key{key} {}

        ResolutionContext* mp_context;
        Key m_key;

      friend class ResolutionContext;
    };

    explicit ResolutionContext(const Components& components) : m_components{components} {}

    ResolutionContext(const ResolutionContext&) = delete;
    ResolutionContext& operator = (const ResolutionContext&) = delete;

    const Components& components() const { return m_components; }

    Entry enter(Category category, const String& name);
    bool in_progress(Category category, const String& name) const { return m_active.contains(Key{category, name}); }
    size_t depth() const { return m_active.size(); }

    template <typename T>
    typename T::Dereferenced dereference(const Reference<T>& ref);

    template <typename T>
    typename T::Dereferenced dereference(const RefOr<T>& either);

  private:
    void leave(const Key& key) { m_active.erase(key); }

  private:
    const Components& m_components;
    std::set<Key> m_active;
};


inline
ResolutionContext::Entry ResolutionContext::enter(Category category, const String& name) {
    Key key{category, name};
    if (m_active.contains(key)) {
        DEBUG("recursive reference to '{}/{}' at depth {}", category_name(category), name, m_active.size());
        throw RecursiveReference(category, name);
    }
    m_active.insert(key);
    DEBUG("resolving '{}/{}' at depth {}", category_name(category), name, m_active.size());
    return Entry{*this, key};
}

template <typename T>
typename T::Dereferenced ResolutionContext::dereference(const Reference<T>& ref) {
    try {
        auto& target = m_components.lookup(ref);
        auto entry = enter(ref.category(), ref.name());
        return target.dereferenced(*this);
    } catch (const ReferenceError& error) {
        DEBUG("failed to resolve '{}': {}", ref.to_str(), error.message());
        throw;
    }
}

template <typename T>
typename T::Dereferenced ResolutionContext::dereference(const RefOr<T>& either) {
    if (auto p_ref = std::get_if<Reference<T>>(&either))
        return dereference(*p_ref);
    return std::get<T>(either).dereferenced(*this);
}

} // namespace apiref
