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
#include <string>
#include <string_view>
#include <variant>

#include <apiref/core/Object.h>
#include <apiref/support/exception.h>
#include <apiref/support/string.h>
#include <apiref/support/types.h>

namespace apiref {

enum Category
{
    SCHEMAS,
    RESPONSES,
    PARAMETERS,
    EXAMPLES,
    REQUEST_BODIES,
    HEADERS,
};

constexpr Category all_categories[] = {SCHEMAS, RESPONSES, PARAMETERS, EXAMPLES, REQUEST_BODIES, HEADERS};

/// Name of the category's table in the components object.
inline
std::string_view category_name(Category category) {
    switch (category) {
        case SCHEMAS:        return "schemas";
        case RESPONSES:      return "responses";
        case PARAMETERS:     return "parameters";
        case EXAMPLES:       return "examples";
        case REQUEST_BODIES: return "requestBodies";
        case HEADERS:        return "headers";
    }
    return "<undefined>";
}

inline
std::optional<Category> parse_category(const StringView& name) {
    for (auto category : all_categories) {
        if (category_name(category) == name)
            return category;
    }
    return std::nullopt;
}

struct Schema;
struct Response;
struct Parameter;
struct Example;
struct RequestBody;
struct Header;

template <typename T> struct CategoryOf;
template <> struct CategoryOf<Schema>      { static constexpr Category value = SCHEMAS; };
template <> struct CategoryOf<Response>    { static constexpr Category value = RESPONSES; };
template <> struct CategoryOf<Parameter>   { static constexpr Category value = PARAMETERS; };
template <> struct CategoryOf<Example>     { static constexpr Category value = EXAMPLES; };
template <> struct CategoryOf<RequestBody> { static constexpr Category value = REQUEST_BODIES; };
template <> struct CategoryOf<Header>      { static constexpr Category value = HEADERS; };

template <typename T>
constexpr Category category_of = CategoryOf<T>::value;


namespace impl {

constexpr std::string_view components_prefix = "#/components/";

// JSON pointer reference token escaping (RFC 6901)
inline
String escape_pointer_token(const StringView& token) {
    String out;
    for (char c : token) {
        if (c == '~')      out += "~0";
        else if (c == '/') out += "~1";
        else               out.push_back(c);
    }
    return out;
}

inline
std::optional<String> unescape_pointer_token(const StringView& token) {
    String out;
    for (size_t i = 0; i < token.size(); ++i) {
        char c = token[i];
        if (c != '~') {
            out.push_back(c);
        } else if (i + 1 < token.size() && token[i + 1] == '0') {
            out.push_back('~'); ++i;
        } else if (i + 1 < token.size() && token[i + 1] == '1') {
            out.push_back('/'); ++i;
        } else {
            return std::nullopt;
        }
    }
    return out;
}

} // namespace impl


//////////////////////////////////////////////////////////////////////////////
/// @brief Named pointer to a definition of type T.
/// A local reference names a (category, name) pair in the document's
/// components.  A remote reference carries an external locator, which is
/// never resolved by this library.
///
/// The category of a local reference is normally category_of<T>, but a
/// reference parsed from text may name another category.  Resolving such a
/// reference is an error rather than a coercion.
//////////////////////////////////////////////////////////////////////////////
template <typename T>
class Reference
{
  public:
    static Reference local(const String& name)                    { return {true, category_of<T>, name}; }
    static Reference local(Category category, const String& name) { return {true, category, name}; }
    static Reference remote(const String& locator)                 { return {false, category_of<T>, locator}; }

    static Reference parse(const StringView& text);
    static Reference decode(const Object& obj, const String& path);

    bool is_local() const  { return m_local; }
    bool is_remote() const { return !m_local; }

    Category category() const { return m_category; }
    const String& name() const { ASSERT(m_local); return m_target; }
    const String& locator() const { ASSERT(!m_local); return m_target; }

    String to_str() const;
    Object encode() const;

    bool operator == (const Reference&) const = default;

  private:
    Reference(bool local, Category category, const String& target)
      : m_local{local}, m_category{category}, m_target{target} {}

  private:
    bool m_local;
    Category m_category;
    String m_target;
};

/// A field that holds either a reference to a T or an inline T.
template <typename T>
using RefOr = std::variant<Reference<T>, T>;

template <typename T>
bool is_reference(const RefOr<T>& either) { return std::holds_alternative<Reference<T>>(either); }


template <typename T>
Reference<T> Reference<T>::parse(const StringView& text) {
    if (!starts_with(text, impl::components_prefix))
        return remote(String{text});

    auto rest = text.substr(impl::components_prefix.size());
    auto slash = rest.find('/');
    if (slash == StringView::npos)
        return remote(String{text});

    auto category = parse_category(rest.substr(0, slash));
    auto token = rest.substr(slash + 1);
    if (!category || token.size() == 0 || token.find('/') != StringView::npos)
        return remote(String{text});

    auto name = impl::unescape_pointer_token(token);
    if (!name)
        return remote(String{text});

    return local(*category, *name);
}

template <typename T>
Reference<T> Reference<T>::decode(const Object& obj, const String& path) {
    if (!obj.is_map() || !obj.get("$ref").is_str())
        throw DecodeError(path, "expected a reference object with a string '$ref'");
    return parse(obj.get("$ref").as<String>());
}

template <typename T>
String Reference<T>::to_str() const {
    if (!m_local) return m_target;
    String text{impl::components_prefix};
    text += category_name(m_category);
    text.push_back('/');
    text += impl::escape_pointer_token(m_target);
    return text;
}

template <typename T>
Object Reference<T>::encode() const {
    Object obj{Object::MAP};
    obj.set("$ref", to_str());
    return obj;
}

template <typename T>
std::ostream& operator<< (std::ostream& ostream, const Reference<T>& ref) {
    ostream << ref.to_str();
    return ostream;
}

} // namespace apiref
