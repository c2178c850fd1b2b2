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

#include <algorithm>
#include <array>
#include <iomanip>
#include <sstream>

#include <apiref/support/exception.h>

namespace apiref::parse {

template <typename StreamType>
class StreamAdapter
{
  public:
    StreamAdapter(StreamType& stream) : m_stream{stream} {
        if (!m_stream.eof())
            fill();
    }

    char peek() { return done()? '\0': m_buf[m_buf_pos]; }

    void next() {
        if (done()) return;
        if (++m_buf_pos >= m_buf_size) {
            m_buf_pos = m_buf_size;
            if (!m_stream.eof())
                fill();
        }
    }

    size_t consumed() const { return m_pos + m_buf_pos; }
    bool done() const { return m_buf_pos == m_buf_size; }
    bool error() const { return m_stream.bad(); }

  private:
    void fill() {
        m_pos += m_buf_size;
        m_stream.read(m_buf.data(), m_buf.size());
        m_buf_size = m_stream.gcount();
        m_buf_pos = 0;
    }

  private:
    StreamType& m_stream;
    size_t m_pos = 0;
    std::array<char, 4096> m_buf;
    size_t m_buf_pos = 0;
    size_t m_buf_size = 0;
};


class StringStreamAdapter
{
  public:
    StringStreamAdapter(const std::string_view& str) : m_str{str} {}

    char peek() { return done()? '\0': m_str[m_pos]; }
    void next() { if (!done()) ++m_pos; }
    size_t consumed() const { return m_pos; }
    bool done() const { return m_pos == m_str.size(); }
    bool error() const { return false; }

  private:
    std::string_view m_str;
    size_t m_pos = 0;
};


constexpr int syntax_context = 72;

struct SyntaxError : public ApirefException
{
    static std::string make_message(const std::string_view& spec, std::ptrdiff_t offset, const std::string& message) {
        offset = std::min(offset, (std::ptrdiff_t)spec.size());
        std::ptrdiff_t ctx_end = std::min(offset + syntax_context, (std::ptrdiff_t)spec.size());
        std::ptrdiff_t ctx_begin = std::max(ctx_end - syntax_context, (std::ptrdiff_t)0);
        std::stringstream ss;
        ss << message << " at offset " << offset << std::endl;
        auto it = spec.cbegin();
        auto end = it + ctx_end;
        it += ctx_begin;
        for (; it != end; ++it) ss << *it;
        ss << std::endl;
        ss << std::setfill('-') << std::setw(offset - ctx_begin + 1) << '^';
        return ss.str();
    }

    SyntaxError(const std::string_view& spec, std::ptrdiff_t offset, const std::string& message)
      : ApirefException(make_message(spec, offset, message)), m_offset{offset} {}

    std::ptrdiff_t offset() const { return m_offset; }

  private:
    std::ptrdiff_t m_offset;
};

} // namespace apiref::parse
