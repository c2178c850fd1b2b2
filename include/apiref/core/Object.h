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

#include <cstdint>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <tsl/ordered_map.h>
#include <variant>
#include <vector>

#include <apiref/support/exception.h>
#include <apiref/support/string.h>
#include <apiref/support/types.h>

namespace apiref {

class Object;

using List = std::vector<Object>;
using Map = tsl::ordered_map<String, Object>;

/// Generic string-keyed map that preserves insertion order.
template <typename T>
using OrderedMap = tsl::ordered_map<String, T>;

//////////////////////////////////////////////////////////////////////////////
/// @brief Dynamic JSON-like value.
/// Used for example payloads, defaults, enum members and vendor extensions,
/// and as the field map the model decoders read from and encoders write to.
///
/// Copies of a list or map Object share the same container, in the same way
/// that copies of a string Object would share a string if strings were not
/// stored inline.  Use copy() to obtain an independent deep copy.
//////////////////////////////////////////////////////////////////////////////
class Object
{
  public:
    enum ReprIX {
        NIL,     // json null, and used to indicate non-existence
        BOOL,
        INT,
        FLOAT,
        STR,
        LIST,
        MAP,     // insertion-ordered map
    };

    static std::string_view type_name(uint8_t repr_ix) {
      switch (repr_ix) {
          case NIL:   return "nil";
          case BOOL:  return "bool";
          case INT:   return "int";
          case FLOAT: return "double";
          case STR:   return "string";
          case LIST:  return "list";
          case MAP:   return "map";
          default:    return "<undefined>";
      }
    }

  public:
    Object()                     : m_repr{nil} {}
    Object(nil_t)                : m_repr{nil} {}
    Object(bool v)               : m_repr{v} {}
    Object(is_like_Int auto v)   : m_repr{(Int)v} {}
    Object(is_like_Float auto v) : m_repr{(Float)v} {}
    Object(const String& str)    : m_repr{str} {}
    Object(String&& str)         : m_repr{std::forward<String>(str)} {}
    Object(const StringView& sv) : m_repr{String{sv}} {}
    Object(const char* v)        : m_repr{String{v}} { ASSERT(v != nullptr); }

    Object(const List&);
    Object(List&&);
    Object(const Map&);
    Object(Map&&);

    Object(ReprIX type);

    ReprIX type() const { return (ReprIX)m_repr.index(); }
    std::string_view type_name() const { return type_name(type()); }

    bool is_nil() const       { return type() == NIL; }
    bool is_bool() const      { return type() == BOOL; }
    bool is_int() const       { return type() == INT; }
    bool is_float() const     { return type() == FLOAT; }
    bool is_num() const       { auto t = type(); return t == INT || t == FLOAT; }
    bool is_str() const       { return type() == STR; }
    bool is_list() const      { return type() == LIST; }
    bool is_map() const       { return type() == MAP; }
    bool is_container() const { auto t = type(); return t == LIST || t == MAP; }

    template <typename T> T as() const requires ::apiref::is_bool<T>;
    template <typename T> T as() const requires std::is_same<T, Int>::value;
    template <typename T> T as() const requires std::is_same<T, Float>::value;
    template <typename T> const T& as() const requires std::is_same<T, String>::value;

    const List& list() const;
    const Map& map() const;

    Float to_float() const;
    String to_str() const;
    String to_json() const;
    void to_json(std::ostream&) const;

    size_t size() const;
    bool contains(const String& key) const;

    Object get(const String& key) const;
    Object get(size_t index) const;

    Object set(const String& key, const Object& value);
    Object push_back(const Object& value);
    void del(const String& key);

    bool operator == (const Object&) const;
    bool operator == (nil_t) const { return is_nil(); }

    bool is(const Object& other) const;
    Object copy() const;

    static WrongType wrong_type(uint8_t actual)                   { return type_name(actual); };
    static WrongType wrong_type(uint8_t actual, uint8_t expected) { return {type_name(actual), type_name(expected)}; };

  private:
    using ListPtr = std::shared_ptr<List>;
    using MapPtr = std::shared_ptr<Map>;
    using Repr = std::variant<nil_t, bool, Int, Float, String, ListPtr, MapPtr>;

    Repr m_repr;
};


inline Object::Object(const List& list) : m_repr{std::make_shared<List>(list)} {}
inline Object::Object(List&& list)      : m_repr{std::make_shared<List>(std::forward<List>(list))} {}
inline Object::Object(const Map& map)   : m_repr{std::make_shared<Map>(map)} {}
inline Object::Object(Map&& map)        : m_repr{std::make_shared<Map>(std::forward<Map>(map))} {}

inline
Object::Object(ReprIX type) {
    switch (type) {
        case NIL:   m_repr = nil; break;
        case BOOL:  m_repr = false; break;
        case INT:   m_repr = (Int)0; break;
        case FLOAT: m_repr = (Float)0; break;
        case STR:   m_repr = String{}; break;
        case LIST:  m_repr = std::make_shared<List>(); break;
        case MAP:   m_repr = std::make_shared<Map>(); break;
        default:    throw wrong_type(type);
    }
}

template <typename T>
T Object::as() const requires ::apiref::is_bool<T> {
    if (auto p = std::get_if<bool>(&m_repr)) return *p;
    throw wrong_type(type(), BOOL);
}

template <typename T>
T Object::as() const requires std::is_same<T, Int>::value {
    if (auto p = std::get_if<Int>(&m_repr)) return *p;
    throw wrong_type(type(), INT);
}

template <typename T>
T Object::as() const requires std::is_same<T, Float>::value {
    if (auto p = std::get_if<Float>(&m_repr)) return *p;
    throw wrong_type(type(), FLOAT);
}

template <typename T>
const T& Object::as() const requires std::is_same<T, String>::value {
    if (auto p = std::get_if<String>(&m_repr)) return *p;
    throw wrong_type(type(), STR);
}

inline
const List& Object::list() const {
    if (auto p = std::get_if<ListPtr>(&m_repr)) return **p;
    throw wrong_type(type(), LIST);
}

inline
const Map& Object::map() const {
    if (auto p = std::get_if<MapPtr>(&m_repr)) return **p;
    throw wrong_type(type(), MAP);
}

inline
Float Object::to_float() const {
    switch (type()) {
        case INT:   return (Float)std::get<Int>(m_repr);
        case FLOAT: return std::get<Float>(m_repr);
        case BOOL:  return std::get<bool>(m_repr)? 1.0: 0.0;
        default:    throw wrong_type(type(), FLOAT);
    }
}

inline
String Object::to_str() const {
    switch (type()) {
        case NIL:   return "nil";
        case BOOL:  return std::get<bool>(m_repr)? "true": "false";
        case INT:   return int_to_str(std::get<Int>(m_repr));
        case FLOAT: return float_to_str(std::get<Float>(m_repr));
        case STR:   return std::get<String>(m_repr);
        default:    return to_json();
    }
}

inline
String Object::to_json() const {
    std::stringstream ss;
    to_json(ss);
    return ss.str();
}

inline
void Object::to_json(std::ostream& os) const {
    switch (type()) {
        case NIL:   os << "null"; break;
        case BOOL:  os << (std::get<bool>(m_repr)? "true": "false"); break;
        case INT:   os << int_to_str(std::get<Int>(m_repr)); break;
        case FLOAT: os << float_to_str(std::get<Float>(m_repr)); break;
        case STR:   os << apiref::quoted(std::get<String>(m_repr)); break;
        case LIST: {
            os << '[';
            bool first = true;
            for (auto& item : list()) {
                if (!first) os << ", ";
                first = false;
                item.to_json(os);
            }
            os << ']';
            break;
        }
        case MAP: {
            os << '{';
            bool first = true;
            for (auto& [key, value] : map()) {
                if (!first) os << ", ";
                first = false;
                os << apiref::quoted(key) << ": ";
                value.to_json(os);
            }
            os << '}';
            break;
        }
    }
}

inline
size_t Object::size() const {
    switch (type()) {
        case STR:  return std::get<String>(m_repr).size();
        case LIST: return list().size();
        case MAP:  return map().size();
        default:   return 0;
    }
}

inline
bool Object::contains(const String& key) const {
    if (!is_map()) return false;
    return map().find(key) != map().end();
}

inline
Object Object::get(const String& key) const {
    if (!is_map()) throw wrong_type(type(), MAP);
    auto& m = map();
    if (auto it = m.find(key); it != m.end())
        return it->second;
    return nil;
}

inline
Object Object::get(size_t index) const {
    if (!is_list()) throw wrong_type(type(), LIST);
    auto& l = list();
    if (index >= l.size()) return nil;
    return l[index];
}

inline
Object Object::set(const String& key, const Object& value) {
    auto p = std::get_if<MapPtr>(&m_repr);
    if (p == nullptr) throw wrong_type(type(), MAP);
    (**p)[key] = value;
    return value;
}

inline
Object Object::push_back(const Object& value) {
    auto p = std::get_if<ListPtr>(&m_repr);
    if (p == nullptr) throw wrong_type(type(), LIST);
    (*p)->push_back(value);
    return value;
}

inline
void Object::del(const String& key) {
    auto p = std::get_if<MapPtr>(&m_repr);
    if (p == nullptr) throw wrong_type(type(), MAP);
    (*p)->erase(key);
}

inline
bool Object::operator == (const Object& other) const {
    auto lhs_type = type();
    auto rhs_type = other.type();
    if (lhs_type != rhs_type) {
        if (is_num() && other.is_num()) return to_float() == other.to_float();
        return false;
    }

    switch (lhs_type) {
        case NIL:   return true;
        case BOOL:  return std::get<bool>(m_repr) == std::get<bool>(other.m_repr);
        case INT:   return std::get<Int>(m_repr) == std::get<Int>(other.m_repr);
        case FLOAT: return std::get<Float>(m_repr) == std::get<Float>(other.m_repr);
        case STR:   return std::get<String>(m_repr) == std::get<String>(other.m_repr);
        case LIST:  return is(other) || list() == other.list();
        case MAP: {
            if (is(other)) return true;
            // ordered_map equality is order-sensitive, objects compare as sets of members
            auto& lhs = map();
            auto& rhs = other.map();
            if (lhs.size() != rhs.size()) return false;
            for (auto& [key, value] : lhs) {
                auto it = rhs.find(key);
                if (it == rhs.end() || !(it->second == value)) return false;
            }
            return true;
        }
    }
    return false;
}

inline
bool Object::is(const Object& other) const {
    if (type() != other.type()) return false;
    switch (type()) {
        case LIST: return std::get<ListPtr>(m_repr) == std::get<ListPtr>(other.m_repr);
        case MAP:  return std::get<MapPtr>(m_repr) == std::get<MapPtr>(other.m_repr);
        default:   return *this == other;
    }
}

inline
Object Object::copy() const {
    switch (type()) {
        case LIST: {
            List list_copy;
            list_copy.reserve(list().size());
            for (auto& item : list())
                list_copy.push_back(item.copy());
            return list_copy;
        }
        case MAP: {
            Map map_copy;
            for (auto& [key, value] : map())
                map_copy.insert({key, value.copy()});
            return map_copy;
        }
        default:
            return *this;
    }
}

inline
std::ostream& operator<< (std::ostream& ostream, const Object& obj) {
    ostream << obj.to_str();
    return ostream;
}

} // namespace apiref
