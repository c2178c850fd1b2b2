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

#include <apiref/core/Object.h>
#include <apiref/support/parse.h>
#include <apiref/support/exception.h>

#include <fmt/format.h>
#include <cctype>
#include <cstdlib>
#include <cerrno>
#include <cstring>
#include <optional>
#include <sstream>
#include <fstream>

namespace apiref {
namespace json {

namespace impl {

template <typename StreamType>
struct Parser
{
  public:
    Parser(const StreamType& stream) : m_it{stream} {}

    Parser(Parser&&) =  default;
    Parser(const Parser&) = delete;
    auto operator = (Parser&&) = delete;
    auto operator = (const Parser&) = delete;

    Object::ReprIX parse_type();  // quickly determine type without full parse
    bool parse_document();
    bool parse_object(char term_char);
    bool parse_number();
    bool parse_string();
    bool parse_map();
    bool parse_list();

    bool expect(const char* seq, const Object& value);
    bool parse_escape(std::string& str);
    bool parse_hex4(uint32_t& code);
    bool parse_unicode_escape(std::string& str);

    void consume_whitespace();

    void create_error(const std::string& message);

    StreamType m_it;
    Object m_curr;
    std::string m_scratch;
    size_t m_error_offset = 0;
    std::string m_error_message;
};

template <typename StreamType>
Object::ReprIX Parser<StreamType>::parse_type() {
    consume_whitespace();
    switch (m_it.peek()) {
        case '{': return Object::MAP;
        case '[': return Object::LIST;
        case 't':
        case 'f': return Object::BOOL;
        case '-':
        case '0':
        case '1':
        case '2':
        case '3':
        case '4':
        case '5':
        case '6':
        case '7':
        case '8':
        case '9':
            if (parse_number())
                return m_curr.type();
            break;
        case '"':
        case '\'':
            return Object::STR;
        default:
            break;
    }
    return Object::NIL;
}

template <typename StreamType>
bool Parser<StreamType>::parse_document()
{
    if (!parse_object('\0')) {
        if (m_error_message.size() == 0) {
            create_error("No object in json stream");
        }
        return false;
    }

    consume_whitespace();
    if (!m_it.done()) {
        create_error("Unexpected trailing characters");
        return false;
    }
    return true;
}

template <typename StreamType>
bool Parser<StreamType>::parse_object(char term_char)
{
    for (; !m_it.done(); m_it.next()) {
        switch (m_it.peek())
        {
            case ' ':
            case '\t':
            case '\r':
            case '\n':
                continue;

            case '-':
            case '0':
            case '1':
            case '2':
            case '3':
            case '4':
            case '5':
            case '6':
            case '7':
            case '8':
            case '9':
                return parse_number();

            case '\'':
            case '"':
                return parse_string();

            case '[': return parse_list();
            case '{': return parse_map();

            case 't': return expect("true", true);
            case 'f': return expect("false", false);
            case 'n': return expect("null", nil);

            default:
                if (m_it.peek() != term_char)
                    create_error("Unexpected character");
                return false;
        }
    }
    return false;
}

template <typename StreamType>
bool Parser<StreamType>::parse_number() {
    m_scratch.clear();

    bool is_done = false;
    bool is_float = false;
    for (; !m_it.done(); m_it.next()) {
        char c = m_it.peek();
        switch (c) {
            case '+':
            case '-':
            case '0':
            case '1':
            case '2':
            case '3':
            case '4':
            case '5':
            case '6':
            case '7':
            case '8':
            case '9':
                break;
            case '.':
            case 'e':
            case 'E':
                is_float = true;
                break;
            default:
                is_done = true;
                break;
        }
        if (is_done) break;
        m_scratch.push_back(c);
    }

    const char* str = m_scratch.c_str();
    const char* scratch_end = str + m_scratch.size();
    char* end = nullptr;
    errno = 0;
    if (is_float) {
        m_curr = Object{strtod(str, &end)};
    } else {
        m_curr = Object{(Int)strtoll(str, &end, 10)};
        if (errno == ERANGE) {
            errno = 0;
            m_curr = Object{strtod(str, &end)};
        }
    }

    if (errno) {
        create_error(strerror(errno));
        errno = 0;
        return false;
    } else if (end != scratch_end) {
        create_error("Numeric syntax error");
        return false;
    } else {
        return true;
    }
}

template <typename StreamType>
bool Parser<StreamType>::parse_escape(std::string& str) {
    char c = m_it.peek();
    switch (c) {
        case '"':  str.push_back('"'); return true;
        case '\'': str.push_back('\''); return true;
        case '\\': str.push_back('\\'); return true;
        case '/':  str.push_back('/'); return true;
        case 'b':  str.push_back('\b'); return true;
        case 'f':  str.push_back('\f'); return true;
        case 'n':  str.push_back('\n'); return true;
        case 'r':  str.push_back('\r'); return true;
        case 't':  str.push_back('\t'); return true;
        case 'u':  return parse_unicode_escape(str);
        default:
            create_error("Invalid escape sequence");
            return false;
    }
}

// Reads the four hex digits following 'u', leaving the iterator on the last digit.
template <typename StreamType>
bool Parser<StreamType>::parse_hex4(uint32_t& code) {
    code = 0;
    for (int i=0; i<4; ++i) {
        m_it.next();
        if (m_it.done() || !std::isxdigit((unsigned char)m_it.peek())) {
            create_error("Invalid unicode escape");
            return false;
        }
        char h = m_it.peek();
        code = (code << 4) | (uint32_t)(std::isdigit((unsigned char)h)? h - '0': (std::tolower(h) - 'a' + 10));
    }
    return true;
}

template <typename StreamType>
bool Parser<StreamType>::parse_unicode_escape(std::string& str) {
    uint32_t code;
    if (!parse_hex4(code)) return false;

    if (code >= 0xDC00 && code <= 0xDFFF) {
        create_error("Unpaired surrogate in unicode escape");
        return false;
    }

    if (code >= 0xD800 && code <= 0xDBFF) {
        m_it.next();
        if (m_it.done() || m_it.peek() != '\\') {
            create_error("Unpaired surrogate in unicode escape");
            return false;
        }
        m_it.next();
        if (m_it.done() || m_it.peek() != 'u') {
            create_error("Unpaired surrogate in unicode escape");
            return false;
        }
        uint32_t low;
        if (!parse_hex4(low)) return false;
        if (low < 0xDC00 || low > 0xDFFF) {
            create_error("Unpaired surrogate in unicode escape");
            return false;
        }
        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
    }

    if (code < 0x80) {
        str.push_back((char)code);
    } else if (code < 0x800) {
        str.push_back((char)(0xC0 | (code >> 6)));
        str.push_back((char)(0x80 | (code & 0x3F)));
    } else if (code < 0x10000) {
        str.push_back((char)(0xE0 | (code >> 12)));
        str.push_back((char)(0x80 | ((code >> 6) & 0x3F)));
        str.push_back((char)(0x80 | (code & 0x3F)));
    } else {
        str.push_back((char)(0xF0 | (code >> 18)));
        str.push_back((char)(0x80 | ((code >> 12) & 0x3F)));
        str.push_back((char)(0x80 | ((code >> 6) & 0x3F)));
        str.push_back((char)(0x80 | (code & 0x3F)));
    }
    return true;
}

template <typename StreamType>
bool Parser<StreamType>::parse_string() {
    char quote = m_it.peek();
    m_it.next();
    bool escape = false;
    std::string str;
    for(; !m_it.done(); m_it.next()) {
        char c = m_it.peek();
        if (escape) {
            escape = false;
            if (!parse_escape(str)) return false;
        } else if (c == '\\') {
            escape = true;
        } else if (c == quote) {
            m_it.next();
            quote = 0;
            break;
        } else {
            str.push_back(c);
        }
    }

    if (quote != 0) {
        create_error("Unterminated string");
        return false;
    }

    m_curr = Object{std::move(str)};
    return true;
}

template <typename StreamType>
bool Parser<StreamType>::parse_list() {
    List list;
    m_it.next();  // consume [
    consume_whitespace();
    if (m_it.peek() == ']') {
        m_it.next();
        m_curr = Object{std::move(list)};
        return true;
    }
    while (!m_it.done()) {
        if (!parse_object(']')) {
            if (m_error_message.size() == 0)
                create_error("Expected value or object");
            return false;
        }
        list.push_back(m_curr);
        consume_whitespace();
        char c = m_it.peek();
        if (c == ']') {
            m_it.next();
            m_curr = Object{std::move(list)};
            return true;
        } else if (c == ',') {
            m_it.next();
            continue;
        } else {
            create_error("Expected token ',' or ']'");
            return false;
        }
    }

    create_error("Unterminated list");
    return false;
}

template <typename StreamType>
bool Parser<StreamType>::parse_map() {
    Map map;
    m_it.next();  // consume {
    consume_whitespace();
    if (m_it.peek() == '}') {
        m_it.next();
        m_curr = Object{std::move(map)};
        return true;
    }

    while (!m_it.done()) {
        // key
        consume_whitespace();
        char c = m_it.peek();
        if (c != '"' && c != '\'') {
            create_error("Expected dictionary key");
            return false;
        }
        if (!parse_string())
            return false;

        String key = m_curr.as<String>();

        consume_whitespace();
        c = m_it.peek();
        if (c != ':') {
            create_error("Expected token ':'");
            return false;
        }

        // consume :
        m_it.next();

        // value
        if (!parse_object('}')) {
            if (m_error_message.size() == 0)
                create_error("Expected dictionary value or object");
            return false;
        }

        map.insert_or_assign(key, m_curr);
        consume_whitespace();

        c = m_it.peek();
        if (c == '}') {
            m_it.next();
            m_curr = Object{std::move(map)};
            return true;
        } else if (c == ',') {
            m_it.next();
            continue;
        } else {
            create_error("Expected token ',' or '}'");
            return false;
        }
    }

    create_error("Unterminated map");
    return false;
}

template <typename StreamType>
bool Parser<StreamType>::expect(const char* seq, const Object& value) {
    const char* seq_it = seq;
    for (; *seq_it != 0; m_it.next(), seq_it++) {
        if (m_it.done() || *seq_it != m_it.peek()) {
            create_error("Invalid literal");
            return false;
        }
    }
    m_curr = value;
    return true;
}

template <typename StreamType>
void Parser<StreamType>::consume_whitespace()
{
    while (!m_it.done() && std::isspace((unsigned char)m_it.peek())) m_it.next();
}

template <typename StreamType>
void Parser<StreamType>::create_error(const std::string& message)
{
    m_error_message = message;
    m_error_offset = m_it.consumed();
}

} // namespace impl


struct Error
{
    size_t error_offset = 0;
    std::string error_message;

    std::string to_str() const {
        if (error_message.size() > 0)
            return fmt::format("JSON parse error at {}: {}", error_offset, error_message);
        return "";
    }
};


inline
Object parse(const std::string_view& str, std::optional<Error>& error) {
    impl::Parser parser{parse::StringStreamAdapter{str}};
    if (!parser.parse_document()) {
        error = Error{parser.m_error_offset, std::move(parser.m_error_message)};
        return nil;
    }
    return parser.m_curr;
}

inline
Object parse(const std::string_view& str, std::string& error) {
    std::optional<Error> parse_error;
    Object result = parse(str, parse_error);
    if (parse_error) {
        error = parse_error->to_str();
        return nil;
    }
    return result;
}

inline
Object parse(const std::string_view& str) {
    impl::Parser parser{parse::StringStreamAdapter{str}};
    if (!parser.parse_document()) {
        throw parse::SyntaxError(str, parser.m_error_offset, parser.m_error_message);
    }
    return parser.m_curr;
}

inline
Object parse_file(const std::string& file_name, std::string& error) {
    std::ifstream f_in{file_name, std::ios::in | std::ios::binary};
    if (!f_in.is_open()) {
        std::stringstream ss;
        ss << "Error opening file: " << file_name;
        error = ss.str();
        return nil;
    } else {
        impl::Parser parser{parse::StreamAdapter{f_in}};
        if (!parser.parse_document()) {
            Error parse_error{parser.m_error_offset, std::move(parser.m_error_message)};
            error = parse_error.to_str();
            return nil;
        }
        if (parser.m_it.error()) {
            error = fmt::format("Error reading file: {}", file_name);
            return nil;
        }
        return parser.m_curr;
    }
}

} // namespace json


inline
Object operator ""_json(const char* str, size_t size) {
    return json::parse(std::string_view{str, size});
}

} // namespace apiref
